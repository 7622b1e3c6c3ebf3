#pragma once

#include "extract/iextractor.hpp"

#include <optional>
#include <string_view>

namespace docshield {

/**
 * @brief PDF text extraction through the poppler command-line tools
 *
 * The page count comes from `pdfinfo`; each page is then pulled with
 * `pdftotext -f N -l N`. When OCR is enabled and both `pdftoppm` and
 * `tesseract` are on PATH, pages without a text layer are rasterized and
 * recognized instead.
 */
class PdfExtractor : public IExtractor {
public:
    explicit PdfExtractor(ExtractionOptions options = {});

    [[nodiscard]] DocumentType document_type() const override { return DocumentType::PDF; }

    /**
     * @throws std::runtime_error if pdfinfo cannot read the document
     */
    [[nodiscard]] std::unique_ptr<ITextUnitStream> open(
        const std::filesystem::path& path) const override;

    [[nodiscard]] std::string name() const override { return "pdf"; }

    /// Parse the "Pages:" line of pdfinfo output; nullopt if absent
    [[nodiscard]] static std::optional<int> parse_page_count(std::string_view pdfinfo_output);

private:
    ExtractionOptions options_;
    bool ocr_available_ = false;
};

} // namespace docshield
