#include "output/record_codec.hpp"

#include <cctype>
#include <format>

namespace docshield {

namespace {

constexpr size_t kSha256HexChars = 64;

bool is_lower_hex(const std::string& s) {
    for (const char c : s) {
        const bool digit = c >= '0' && c <= '9';
        const bool hex_alpha = c >= 'a' && c <= 'f';
        if (!digit && !hex_alpha) return false;
    }
    return true;
}

Result<Record> invalid(std::string message) {
    return Result<Record>::error(ErrorCategory::INVALID_RECORD, std::move(message));
}

bool is_non_negative_integer(const nlohmann::json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

} // anonymous namespace

nlohmann::ordered_json record_to_json(const Record& record) {
    nlohmann::ordered_json entities = nlohmann::ordered_json::array();
    for (const auto& e : record.entities) {
        nlohmann::ordered_json entity;
        entity["type"] = entity_category_to_string(e.category);
        entity["start"] = e.start;
        entity["end"] = e.end;
        entities.push_back(std::move(entity));
    }

    nlohmann::ordered_json j;
    j["document_id"] = record.document_id;
    j["source_path"] = record.source_path;
    j["file_sha256"] = record.file_sha256;
    j["file_type"] = document_type_to_string(record.file_type);
    if (record.page_number.has_value()) {
        j["page_number"] = *record.page_number;
    } else {
        j["page_number"] = nullptr;
    }
    j["chunk_index"] = record.chunk_index;
    j["text"] = record.text;
    j["entities"] = std::move(entities);
    return j;
}

std::string serialize_record(const Record& record) {
    return record_to_json(record).dump(
        -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

Result<Record> parse_record(std::string_view line) {
    const auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return invalid("line is not valid JSON");
    }
    if (!j.is_object()) {
        return invalid("record must be a JSON object");
    }

    for (const char* key : {"document_id", "source_path", "file_sha256", "file_type", "text"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            return invalid(std::format("'{}' must be a string", key));
        }
    }

    Record record;
    record.document_id = j["document_id"].get<std::string>();
    record.source_path = j["source_path"].get<std::string>();
    record.file_sha256 = j["file_sha256"].get<std::string>();
    record.text = j["text"].get<std::string>();

    if (record.file_sha256.size() != kSha256HexChars || !is_lower_hex(record.file_sha256)) {
        return invalid("'file_sha256' must be 64 lowercase hex characters");
    }

    const auto type = document_type_from_string(j["file_type"].get<std::string>());
    if (!type.has_value()) {
        return invalid(std::format("unknown file_type '{}'", j["file_type"].get<std::string>()));
    }
    record.file_type = *type;

    if (!j.contains("page_number")) {
        return invalid("'page_number' is missing");
    }
    const auto& page = j["page_number"];
    if (page.is_null()) {
        record.page_number = std::nullopt;
    } else if (page.is_number_integer()) {
        record.page_number = page.get<int>();
    } else {
        return invalid("'page_number' must be an integer or null");
    }

    if (!j.contains("chunk_index") || !is_non_negative_integer(j["chunk_index"])) {
        return invalid("'chunk_index' must be a non-negative integer");
    }
    record.chunk_index = j["chunk_index"].get<size_t>();

    if (!j.contains("entities") || !j["entities"].is_array()) {
        return invalid("'entities' must be an array");
    }
    for (const auto& e : j["entities"]) {
        if (!e.is_object() || !e.contains("type") || !e["type"].is_string()) {
            return invalid("entity 'type' must be a string");
        }
        const auto category = entity_category_from_string(e["type"].get<std::string>());
        if (!category.has_value()) {
            return invalid(std::format("unknown entity type '{}'", e["type"].get<std::string>()));
        }
        if (!e.contains("start") || !e.contains("end") ||
            !is_non_negative_integer(e["start"]) || !is_non_negative_integer(e["end"])) {
            return invalid("entity offsets must be non-negative integers");
        }
        EntityMatch match{*category, e["start"].get<size_t>(), e["end"].get<size_t>()};
        if (match.start >= match.end) {
            return invalid("entity 'start' must be less than 'end'");
        }
        record.entities.push_back(match);
    }

    return Result<Record>::ok(std::move(record));
}

} // namespace docshield
