#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

// ============================================================================
// PII Categories
// ============================================================================

enum class EntityCategory {
    EMAIL_ADDRESS,
    PHONE_NUMBER,
    IP_ADDRESS,
    CREDIT_CARD,
    SSN,
    DATE
};

inline constexpr std::array<EntityCategory, 6> kAllEntityCategories = {
    EntityCategory::EMAIL_ADDRESS,
    EntityCategory::PHONE_NUMBER,
    EntityCategory::IP_ADDRESS,
    EntityCategory::CREDIT_CARD,
    EntityCategory::SSN,
    EntityCategory::DATE,
};

inline constexpr const char* entity_category_to_string(EntityCategory category) {
    switch (category) {
        case EntityCategory::EMAIL_ADDRESS: return "EMAIL_ADDRESS";
        case EntityCategory::PHONE_NUMBER:  return "PHONE_NUMBER";
        case EntityCategory::IP_ADDRESS:    return "IP_ADDRESS";
        case EntityCategory::CREDIT_CARD:   return "CREDIT_CARD";
        case EntityCategory::SSN:           return "SSN";
        case EntityCategory::DATE:          return "DATE";
    }
    return "UNKNOWN";
}

inline std::optional<EntityCategory> entity_category_from_string(std::string_view name) {
    for (const auto category : kAllEntityCategories) {
        if (name == entity_category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

/**
 * @brief A detected PII span
 *
 * Half-open [start, end) offsets in code points of the pre-redaction text
 * the detection ran on.
 */
struct EntityMatch {
    EntityCategory category = EntityCategory::EMAIL_ADDRESS;
    size_t start = 0;
    size_t end = 0;

    bool operator==(const EntityMatch&) const = default;
};

struct AnonymizationResult {
    std::string text;
    std::vector<EntityMatch> entities;
};

// ============================================================================
// Documents & Records
// ============================================================================

enum class DocumentType {
    PDF,
    EXCEL
};

inline constexpr const char* document_type_to_string(DocumentType type) {
    switch (type) {
        case DocumentType::PDF:   return "pdf";
        case DocumentType::EXCEL: return "excel";
    }
    return "unknown";
}

inline std::optional<DocumentType> document_type_from_string(std::string_view name) {
    if (name == "pdf") return DocumentType::PDF;
    if (name == "excel") return DocumentType::EXCEL;
    return std::nullopt;
}

/**
 * @brief Raw text produced by an extraction collaborator
 *
 * Paginated sources set a 1-based page_number; tabular sources yield one
 * flattened row per unit and leave it empty.
 */
struct TextUnit {
    std::optional<int> page_number;
    std::string text;
};

/**
 * @brief The persisted unit of output, one per chunk
 *
 * Entity offsets refer to the chunk text before redaction, not to `text`.
 */
struct Record {
    std::string document_id;
    std::string source_path;
    std::string file_sha256;
    DocumentType file_type = DocumentType::PDF;
    std::optional<int> page_number;
    size_t chunk_index = 0;
    std::string text;
    std::vector<EntityMatch> entities;

    bool operator==(const Record&) const = default;
};

} // namespace docshield
