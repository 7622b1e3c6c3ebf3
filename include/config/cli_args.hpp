#pragma once

#include "config/config_loader.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

inline constexpr const char* kSecretEnvVar = "ANONYMIZATION_SECRET";

enum class CliCommand {
    INGEST,
    VERIFY,
    HELP
};

/**
 * @brief Parsed command line; unset optionals fall back to the config file
 */
struct CliArgs {
    CliCommand command = CliCommand::INGEST;

    std::vector<std::string> inputs;
    std::optional<std::string> output;
    std::optional<std::string> secret;
    std::optional<std::string> config_file;
    std::optional<std::string> overlap_policy;
    std::optional<std::string> log_level;
    std::optional<size_t> max_chars_per_chunk;
    std::optional<size_t> jobs;
    bool ocr = false;

    std::string verify_path;    ///< verify subcommand only
};

struct CliParseResult {
    bool success;
    std::string error_message;
    CliArgs args;

    static CliParseResult ok(CliArgs parsed) {
        CliParseResult result;
        result.success = true;
        result.args = std::move(parsed);
        return result;
    }

    static CliParseResult error(std::string message) {
        CliParseResult result;
        result.success = false;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Parse `docshield [ingest|verify] [options]`
 *
 * Accepts both "--flag value" and "--flag=value". `ingest` is implied when
 * the first argument is an option.
 */
[[nodiscard]] CliParseResult parse_cli_args(int argc, const char* const* argv);

[[nodiscard]] std::string usage_text();

/**
 * @brief Final ingest configuration: config file, then flags on top
 *
 * The secret comes from --secret, else ANONYMIZATION_SECRET, else the
 * config file. Fails when the secret, inputs or output are missing, or the
 * merged values are out of range.
 */
[[nodiscard]] ConfigLoader::LoadResult resolve_ingest_config(const CliArgs& args);

} // namespace docshield
