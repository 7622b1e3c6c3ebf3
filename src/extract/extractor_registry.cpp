#include "extract/extractor_registry.hpp"
#include "extract/pdf_extractor.hpp"
#ifdef ENABLE_XLSX
#include "extract/xlsx_extractor.hpp"
#endif
#include "core/utils.hpp"

#include <algorithm>

namespace docshield {

const std::vector<std::string>& ExtractorRegistry::supported_extensions() {
    static const std::vector<std::string> kExtensions = {".pdf", ".xlsx", ".xls", ".xlsm"};
    return kExtensions;
}

bool ExtractorRegistry::is_supported_extension(const std::filesystem::path& path) {
    const auto ext = utils::to_lower(path.extension().string());
    const auto& exts = supported_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

ExtractorRegistry ExtractorRegistry::with_builtin_extractors(const ExtractionOptions& options) {
    ExtractorRegistry registry;
    registry.register_extractor({".pdf"}, std::make_shared<PdfExtractor>(options));

#ifdef ENABLE_XLSX
    registry.register_extractor({".xlsx", ".xlsm", ".xls"}, std::make_shared<XlsxExtractor>());
#else
    utils::log::warn("Spreadsheet support not compiled in (ENABLE_XLSX); .xlsx/.xlsm/.xls files will be skipped");
#endif

    return registry;
}

void ExtractorRegistry::register_extractor(
    const std::vector<std::string>& extensions,
    std::shared_ptr<const IExtractor> extractor) {
    for (const auto& ext : extensions) {
        extractors_[utils::to_lower(ext)] = extractor;
    }
}

const IExtractor* ExtractorRegistry::find(const std::filesystem::path& path) const {
    const auto it = extractors_.find(utils::to_lower(path.extension().string()));
    return it == extractors_.end() ? nullptr : it->second.get();
}

} // namespace docshield
