#include "extract/pdf_extractor.hpp"
#include "extract/command_runner.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <system_error>

namespace docshield {

namespace {

class PdfPageStream : public ITextUnitStream {
public:
    PdfPageStream(std::filesystem::path path, int page_count,
                  bool ocr, int ocr_dpi)
        : path_(std::move(path)),
          quoted_path_(command::shell_quote(path_.string())),
          page_count_(page_count),
          ocr_(ocr),
          ocr_dpi_(ocr_dpi) {}

    std::optional<TextUnit> next() override {
        if (current_ > page_count_) {
            return std::nullopt;
        }
        const int page = current_++;

        TextUnit unit;
        unit.page_number = page;
        unit.text = extract_page(page);

        if (utils::is_blank(unit.text) && ocr_) {
            unit.text = ocr_page(page);
        }
        return unit;
    }

private:
    std::string extract_page(int page) const {
        const auto cmd = std::format("pdftotext -q -enc UTF-8 -f {} -l {} {} -",
            page, page, quoted_path_);
        auto result = command::run(cmd);
        if (!result.ok()) {
            utils::log::warn(std::format("Text extraction failed on {} page {} (exit {})",
                path_.string(), page, result.exit_code));
            return {};
        }
        // pdftotext ends every page with a form feed
        if (!result.output.empty() && result.output.back() == '\f') {
            result.output.pop_back();
        }
        return std::move(result.output);
    }

    std::string ocr_page(int page) const {
        const auto image = command::temp_file_path(".png");
        // pdftoppm appends the extension itself in -singlefile mode
        auto stem = image;
        stem.replace_extension();

        const auto render = std::format("pdftoppm -q -f {} -l {} -r {} -png -singlefile {} {}",
            page, page, ocr_dpi_, quoted_path_, command::shell_quote(stem.string()));
        const auto rendered = command::run(render);

        std::string text;
        if (!rendered.ok()) {
            utils::log::warn(std::format("OCR rasterization failed on {} page {}",
                path_.string(), page));
        } else {
            auto recognized = command::run(std::format("tesseract {} stdout",
                command::shell_quote(image.string())));
            if (recognized.ok()) {
                text = std::move(recognized.output);
            } else {
                utils::log::warn(std::format("OCR failed on {} page {}", path_.string(), page));
            }
        }

        std::error_code ec;
        std::filesystem::remove(image, ec);
        return text;
    }

    std::filesystem::path path_;
    std::string quoted_path_;
    int page_count_;
    bool ocr_;
    int ocr_dpi_;
    int current_ = 1;
};

} // anonymous namespace

PdfExtractor::PdfExtractor(ExtractionOptions options)
    : options_(options) {
    if (options_.ocr) {
        ocr_available_ = command::has_tool("pdftoppm") && command::has_tool("tesseract");
        if (!ocr_available_) {
            utils::log::warn("OCR requested but pdftoppm/tesseract not found on PATH; OCR disabled");
        }
    }
}

std::optional<int> PdfExtractor::parse_page_count(std::string_view pdfinfo_output) {
    constexpr std::string_view kKey = "Pages:";
    size_t line_start = 0;
    while (line_start < pdfinfo_output.size()) {
        auto line_end = pdfinfo_output.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = pdfinfo_output.size();
        }
        const auto line = pdfinfo_output.substr(line_start, line_end - line_start);
        if (line.starts_with(kKey)) {
            return utils::try_parse_int<int>(utils::trim(line.substr(kKey.size())));
        }
        line_start = line_end + 1;
    }
    return std::nullopt;
}

std::unique_ptr<ITextUnitStream> PdfExtractor::open(const std::filesystem::path& path) const {
    const auto info = command::run("pdfinfo " + command::shell_quote(path.string()));
    if (!info.ok()) {
        throw std::runtime_error(std::format("pdfinfo could not read {} (exit {})",
            path.string(), info.exit_code));
    }

    const auto pages = parse_page_count(info.output);
    if (!pages || *pages < 0) {
        throw std::runtime_error("pdfinfo reported no page count for " + path.string());
    }

    utils::log::debug(std::format("{}: {} pages", path.string(), *pages));
    return std::make_unique<PdfPageStream>(path, *pages, ocr_available_, options_.ocr_dpi);
}

} // namespace docshield
