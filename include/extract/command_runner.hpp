#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace docshield::command {

struct CommandResult {
    int exit_code = -1;
    std::string output;     ///< captured stdout

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

/**
 * @brief Run a shell command and capture its stdout (stderr is discarded)
 * @throws std::runtime_error if the process cannot be started
 */
[[nodiscard]] CommandResult run(const std::string& cmd);

/// True if `tool` resolves on PATH
[[nodiscard]] bool has_tool(const std::string& tool);

/// Single-quote an argument for /bin/sh
[[nodiscard]] std::string shell_quote(std::string_view arg);

/// Unique path in the system temp directory ending in `suffix`
[[nodiscard]] std::filesystem::path temp_file_path(const std::string& suffix);

} // namespace docshield::command
