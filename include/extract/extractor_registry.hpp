#pragma once

#include "extract/iextractor.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace docshield {

/**
 * @brief Maps lowercase file extensions to extractors
 *
 * Usage:
 *   ExtractorRegistry registry;
 *   registry.register_extractor({".pdf"}, std::make_shared<PdfExtractor>(opts));
 *   const IExtractor* ex = registry.find("report.PDF");
 */
class ExtractorRegistry {
public:
    /// Extensions the tool recognizes, whether or not an extractor is compiled in
    static const std::vector<std::string>& supported_extensions();

    [[nodiscard]] static bool is_supported_extension(const std::filesystem::path& path);

    /**
     * @brief Registry with the built-in PDF extractor and, when compiled
     * with ENABLE_XLSX, the spreadsheet extractor
     */
    [[nodiscard]] static ExtractorRegistry with_builtin_extractors(const ExtractionOptions& options);

    void register_extractor(const std::vector<std::string>& extensions,
                            std::shared_ptr<const IExtractor> extractor);

    /// Extractor for the path's extension (case-insensitive), or nullptr
    [[nodiscard]] const IExtractor* find(const std::filesystem::path& path) const;

    [[nodiscard]] size_t size() const { return extractors_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const IExtractor>> extractors_;
};

} // namespace docshield
