#pragma once

#include "core/types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace docshield {

/**
 * @brief Single-pass, lazily produced sequence of text units from one file
 *
 * next() returns units in document order until it returns nullopt. A
 * recoverable per-page problem yields a unit with empty text; a source-level
 * failure (corrupt file, unreadable archive) throws.
 */
class ITextUnitStream {
public:
    virtual ~ITextUnitStream() = default;

    [[nodiscard]] virtual std::optional<TextUnit> next() = 0;
};

/**
 * @brief Extraction collaborator for one family of file formats
 */
class IExtractor {
public:
    virtual ~IExtractor() = default;

    /// Kind of document this extractor produces (drives record assembly)
    [[nodiscard]] virtual DocumentType document_type() const = 0;

    /**
     * @brief Start extracting `path`
     * @throws std::runtime_error if the source cannot be opened or decoded
     */
    [[nodiscard]] virtual std::unique_ptr<ITextUnitStream> open(
        const std::filesystem::path& path) const = 0;

    /// Human-readable extractor name for logging
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Options shared by the built-in extractors
 */
struct ExtractionOptions {
    bool ocr = false;     ///< OCR pages without a text layer
    int ocr_dpi = 300;
};

} // namespace docshield
