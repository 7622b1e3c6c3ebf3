#include "extract/command_runner.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace docshield::command {

CommandResult run(const std::string& cmd) {
    const std::string full = cmd + " 2>/dev/null";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to start command: " + cmd);
    }

    CommandResult result;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

bool has_tool(const std::string& tool) {
    const std::string cmd = "command -v " + shell_quote(tool) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string shell_quote(std::string_view arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::filesystem::path temp_file_path(const std::string& suffix) {
    static std::atomic<unsigned> counter{0};
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const std::string name = "docshield_" + std::to_string(::getpid()) + "_"
        + std::to_string(now) + "_" + std::to_string(counter++) + suffix;
    return std::filesystem::temp_directory_path() / name;
}

} // namespace docshield::command
