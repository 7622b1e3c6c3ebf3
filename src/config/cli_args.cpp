#include "config/cli_args.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <string_view>

namespace docshield {

namespace {

std::optional<size_t> parse_positive(std::string_view value) {
    const auto parsed = utils::try_parse_int<size_t>(value);
    if (!parsed || *parsed == 0) {
        return std::nullopt;
    }
    return parsed;
}

} // anonymous namespace

std::string usage_text() {
    return
        "Usage:\n"
        "  docshield ingest --input PATH [--input PATH ...] --output PATH [options]\n"
        "  docshield verify PATH\n"
        "\n"
        "Ingest options:\n"
        "  --input PATH                File or directory (repeatable)\n"
        "  --output PATH               Output .jsonl.gz path\n"
        "  --secret S                  Anonymization secret (or set ANONYMIZATION_SECRET)\n"
        "  --ocr                       OCR PDF pages without a text layer (needs pdftoppm, tesseract)\n"
        "  --max-chars-per-chunk N     Maximum characters per chunk (default 4000)\n"
        "  --jobs N                    Files processed concurrently (default 1)\n"
        "  --overlap-policy P          apply_all | longest_match | first_category\n"
        "  --config FILE               TOML config file\n"
        "  --log-level L               debug | info | warn | error\n"
        "  -h, --help                  Show this help\n";
}

CliParseResult parse_cli_args(int argc, const char* const* argv) {
    CliArgs args;
    int i = 1;

    if (i < argc) {
        const std::string_view first = argv[i];
        if (first == "ingest") {
            ++i;
        } else if (first == "verify") {
            args.command = CliCommand::VERIFY;
            ++i;
        } else if (first == "-h" || first == "--help" || first == "help") {
            args.command = CliCommand::HELP;
            return CliParseResult::ok(std::move(args));
        } else if (!first.starts_with("-")) {
            return CliParseResult::error(std::format("Unknown command '{}'", first));
        }
    }

    for (; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::optional<std::string_view> inline_value;

        if (arg == "-h" || arg == "--help") {
            args.command = CliCommand::HELP;
            return CliParseResult::ok(std::move(args));
        }

        if (!arg.starts_with("-")) {
            if (args.command == CliCommand::VERIFY && args.verify_path.empty()) {
                args.verify_path = std::string(arg);
                continue;
            }
            return CliParseResult::error(std::format("Unexpected argument '{}'", arg));
        }

        if (const auto eq = arg.find('='); arg.starts_with("--") && eq != std::string_view::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        if (arg == "--ocr") {
            if (inline_value) {
                return CliParseResult::error("--ocr does not take a value");
            }
            args.ocr = true;
            continue;
        }

        // Every remaining option takes a value
        std::string_view value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            return CliParseResult::error(std::format("Option {} requires a value", arg));
        }

        if (arg == "--input") {
            args.inputs.emplace_back(value);
        } else if (arg == "--output") {
            args.output = std::string(value);
        } else if (arg == "--secret") {
            args.secret = std::string(value);
        } else if (arg == "--config") {
            args.config_file = std::string(value);
        } else if (arg == "--overlap-policy") {
            args.overlap_policy = std::string(value);
        } else if (arg == "--log-level") {
            args.log_level = std::string(value);
        } else if (arg == "--max-chars-per-chunk") {
            args.max_chars_per_chunk = parse_positive(value);
            if (!args.max_chars_per_chunk) {
                return CliParseResult::error(std::format(
                    "--max-chars-per-chunk must be a positive integer, got '{}'", value));
            }
        } else if (arg == "--jobs") {
            args.jobs = parse_positive(value);
            if (!args.jobs) {
                return CliParseResult::error(std::format(
                    "--jobs must be a positive integer, got '{}'", value));
            }
        } else {
            return CliParseResult::error(std::format("Unknown option {}", arg));
        }
    }

    if (args.command == CliCommand::VERIFY && args.verify_path.empty()) {
        return CliParseResult::error("verify requires a PATH");
    }
    return CliParseResult::ok(std::move(args));
}

ConfigLoader::LoadResult resolve_ingest_config(const CliArgs& args) {
    DocshieldConfig config;
    if (args.config_file) {
        auto loaded = ConfigLoader::load_from_file(*args.config_file);
        if (!loaded.success) {
            return loaded;
        }
        config = std::move(loaded.config);
    }

    if (!args.inputs.empty()) config.ingest.inputs = args.inputs;
    if (args.output) config.ingest.output = *args.output;
    if (args.max_chars_per_chunk) config.ingest.max_chars_per_chunk = *args.max_chars_per_chunk;
    if (args.jobs) config.ingest.jobs = *args.jobs;
    if (args.ocr) config.ingest.ocr = true;
    if (args.overlap_policy) config.anonymization.overlap_policy = *args.overlap_policy;
    if (args.log_level) config.logging.level = *args.log_level;

    if (args.secret && !args.secret->empty()) {
        config.anonymization.secret = *args.secret;
    } else if (const char* env = std::getenv(kSecretEnvVar); env && *env) {
        config.anonymization.secret = env;
    }

    auto errors = ConfigLoader::validate_config(config);
    if (config.anonymization.secret.empty()) {
        errors.push_back(std::format("Missing --secret or {}", kSecretEnvVar));
    }
    if (config.ingest.inputs.empty()) {
        errors.push_back("No --input given");
    }
    if (config.ingest.output.empty()) {
        errors.push_back("No --output given");
    }

    if (!errors.empty()) {
        std::string combined = "Invalid ingest configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // namespace docshield
