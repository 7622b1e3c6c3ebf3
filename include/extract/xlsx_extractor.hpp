#pragma once

#include "extract/iextractor.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace docshield {

/**
 * @brief Office Open XML spreadsheet extraction (miniz + tinyxml2)
 *
 * Every non-empty row becomes one text unit, flattened as
 * "<sheet> | C<col>:<value> | ..." with 1-based column indexes taken from
 * the cell reference. Sheets are read in workbook order, one at a time.
 * Cached formula results are used; formulas are never evaluated.
 * Numbers whose cell style carries a date or time format are rendered as
 * "YYYY-MM-DD HH:MM:SS" (or "HH:MM:SS" for a bare time of day).
 */
class XlsxExtractor : public IExtractor {
public:
    [[nodiscard]] DocumentType document_type() const override { return DocumentType::EXCEL; }

    /**
     * @throws std::runtime_error for unreadable archives, a missing workbook
     * part, or legacy binary .xls files
     */
    [[nodiscard]] std::unique_ptr<ITextUnitStream> open(
        const std::filesystem::path& path) const override;

    [[nodiscard]] std::string name() const override { return "xlsx"; }

    /// 1-based column index of a cell reference ("C7" -> 3); 0 if malformed
    [[nodiscard]] static int column_index(std::string_view cell_ref);

    /**
     * True for the built-in date/time formats (14-22, 45-47) when no format
     * code is given, otherwise for codes whose first section holds a
     * d/m/y/h/s token outside quotes, brackets and escapes
     */
    [[nodiscard]] static bool is_date_format(int num_fmt_id, std::string_view format_code = {});

    /**
     * Serial day number to timestamp text, honoring the 1900 leap-year bug
     * for serials below 60. std::nullopt when outside years 1-9999.
     */
    [[nodiscard]] static std::optional<std::string> format_serial_date(double serial,
                                                                       bool date1904 = false);
};

} // namespace docshield
