#include "config/config_loader.hpp"
#include "core/anonymizer.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace docshield {

namespace {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Non-negative integer or the fallback; negative values are reported
size_t toml_count(const toml::table& tbl, std::string_view key, size_t fallback,
                  std::vector<std::string>& errors, std::string_view section) {
    const auto value = tbl[key].value<int64_t>();
    if (!value) {
        if (tbl.contains(key)) {
            errors.push_back(std::format("{}.{} must be an integer", section, key));
        }
        return fallback;
    }
    if (*value < 0) {
        errors.push_back(std::format("{}.{} must not be negative, got {}", section, key, *value));
        return fallback;
    }
    return static_cast<size_t>(*value);
}

std::vector<std::string> toml_string_or_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) {
        result.emplace_back(s->get());
    } else if (const auto* arr = node.as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* item = elem.as_string()) {
                result.emplace_back(item->get());
            }
        }
    }
    return result;
}

// ============================================================================
// Section extraction
// ============================================================================

IngestConfig extract_ingest(const toml::table& root, std::vector<std::string>& errors) {
    IngestConfig cfg;
    const auto* ingest = root["ingest"].as_table();
    if (!ingest) return cfg;
    const auto& t = *ingest;

    cfg.inputs = toml_string_or_array(t, "inputs");
    cfg.output = t["output"].value_or(""s);
    cfg.max_chars_per_chunk = toml_count(t, "max_chars_per_chunk", cfg.max_chars_per_chunk, errors, "ingest");
    cfg.ocr = t["ocr"].value_or(cfg.ocr);
    cfg.jobs = toml_count(t, "jobs", cfg.jobs, errors, "ingest");
    return cfg;
}

AnonymizationConfig extract_anonymization(const toml::table& root) {
    AnonymizationConfig cfg;
    const auto* anon = root["anonymization"].as_table();
    if (!anon) return cfg;
    const auto& a = *anon;

    cfg.secret = a["secret"].value_or(""s);
    cfg.overlap_policy = a["overlap_policy"].value_or(cfg.overlap_policy);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    cfg.compression_level = static_cast<int>((*output)["compression_level"].value_or(int64_t{9}));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ConfigLoader::LoadResult extract_and_validate(const toml::table& tbl) {
    std::vector<std::string> errors;

    DocshieldConfig config;
    config.ingest = extract_ingest(tbl, errors);
    config.anonymization = extract_anonymization(tbl);
    config.output = extract_output(tbl);
    config.logging = extract_logging(tbl);

    for (auto& err : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DocshieldConfig& config) {
    std::vector<std::string> errors;

    if (config.ingest.max_chars_per_chunk == 0) {
        errors.push_back("ingest.max_chars_per_chunk must be > 0");
    }
    if (config.ingest.jobs == 0) {
        errors.push_back("ingest.jobs must be > 0");
    }
    if (config.output.compression_level < 0 || config.output.compression_level > 9) {
        errors.push_back(std::format("output.compression_level must be 0-9, got {}",
            config.output.compression_level));
    }
    if (!overlap_policy_from_string(config.anonymization.overlap_policy)) {
        errors.push_back(std::format(
            "anonymization.overlap_policy must be apply_all, longest_match or first_category, got '{}'",
            config.anonymization.overlap_policy));
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace docshield
