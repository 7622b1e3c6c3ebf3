#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace docshield {

/**
 * @brief JSON form of a record, keys in schema order:
 * document_id, source_path, file_sha256, file_type, page_number,
 * chunk_index, text, entities[{type, start, end}]
 */
[[nodiscard]] nlohmann::ordered_json record_to_json(const Record& record);

/**
 * @brief One JSON Lines line (no trailing newline)
 *
 * Control characters are escaped so the line never spans multiple lines.
 * Invalid UTF-8 is replaced with U+FFFD.
 */
[[nodiscard]] std::string serialize_record(const Record& record);

/**
 * @brief Parse and validate one line against the record schema
 */
[[nodiscard]] Result<Record> parse_record(std::string_view line);

} // namespace docshield
