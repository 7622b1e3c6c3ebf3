#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docshield {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct IngestConfig {
    std::vector<std::string> inputs;
    std::string output;
    size_t max_chars_per_chunk = 4000;
    bool ocr = false;
    size_t jobs = 1;
};

struct AnonymizationConfig {
    std::string secret;
    std::string overlap_policy = "apply_all";
};

struct OutputConfig {
    int compression_level = 9;
};

struct LoggingConfig {
    std::string level = "info";
};

struct DocshieldConfig {
    IngestConfig ingest;
    AnonymizationConfig anonymization;
    OutputConfig output;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        DocshieldConfig config;

        static LoadResult ok(DocshieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     *
     * String values may reference environment variables as ${NAME};
     * unset variables expand to the empty string.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Range and enum checks on a fully assembled config
     *
     * Secret and input presence are not checked here; they may still come
     * from the command line or environment.
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const DocshieldConfig& config);
};

} // namespace docshield
