#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace docshield {

/**
 * @brief Expand input paths into the ordered list of files to ingest
 *
 * Directories are walked recursively and contribute every regular file with
 * a supported extension (case-insensitive), sorted by path. A regular file
 * named directly is kept whatever its extension so the pipeline can report
 * it as skipped. Missing paths are logged and ignored. Duplicates keep their
 * first position.
 */
[[nodiscard]] std::vector<std::filesystem::path> discover_input_files(
    const std::vector<std::filesystem::path>& inputs);

[[nodiscard]] std::vector<std::filesystem::path> discover_input_files(
    const std::filesystem::path& input);

/**
 * @brief Lowercase hex SHA-256 of the whole file
 * @throws std::runtime_error if the file cannot be read
 */
[[nodiscard]] std::string compute_file_sha256(const std::filesystem::path& path);

} // namespace docshield
