#include "extract/xlsx_extractor.hpp"
#include "core/utils.hpp"

#include <miniz.h>
#include <tinyxml2.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstring>
#include <deque>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace docshield {

namespace {

// Read-only view of the zip container; entries are inflated on demand
class ZipPackage {
public:
    explicit ZipPackage(const std::filesystem::path& path)
        : path_(path.string()) {
        std::memset(&archive_, 0, sizeof(archive_));
        if (!mz_zip_reader_init_file(&archive_, path_.c_str(), 0)) {
            throw std::runtime_error(std::format("Not a readable zip package: {} ({})",
                path_, mz_zip_get_error_string(mz_zip_get_last_error(&archive_))));
        }
    }

    ~ZipPackage() { mz_zip_reader_end(&archive_); }

    ZipPackage(const ZipPackage&) = delete;
    ZipPackage& operator=(const ZipPackage&) = delete;

    [[nodiscard]] bool contains(const std::string& name) {
        return mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0) >= 0;
    }

    // Throws when the entry is absent or fails to inflate
    [[nodiscard]] std::string read(const std::string& name) {
        size_t size = 0;
        void* data = mz_zip_reader_extract_file_to_heap(&archive_, name.c_str(), &size, 0);
        if (!data) {
            throw std::runtime_error(std::format("{}: cannot read part {} ({})",
                path_, name, mz_zip_get_error_string(mz_zip_get_last_error(&archive_))));
        }
        std::string out(static_cast<const char*>(data), size);
        mz_free(data);
        return out;
    }

private:
    std::string path_;
    mz_zip_archive archive_;
};

struct SheetRef {
    std::string name;
    std::string part;   // zip entry name, e.g. xl/worksheets/sheet1.xml
};

void parse_xml(tinyxml2::XMLDocument& doc, const std::string& xml, const std::string& part) {
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw std::runtime_error(std::format("Malformed XML in {}: {}", part, doc.ErrorStr()));
    }
}

// Concatenated <t> text below `node`, skipping phonetic runs
void collect_text(const tinyxml2::XMLElement* node, std::string& out) {
    for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
        const char* name = child->Name();
        if (std::strcmp(name, "t") == 0) {
            if (const char* text = child->GetText()) out += text;
        } else if (std::strcmp(name, "rPh") != 0) {
            collect_text(child, out);
        }
    }
}

std::vector<std::string> load_shared_strings(ZipPackage& zip) {
    std::vector<std::string> values;
    const std::string part = "xl/sharedStrings.xml";
    if (!zip.contains(part)) {
        return values;
    }

    tinyxml2::XMLDocument doc;
    parse_xml(doc, zip.read(part), part);
    const auto* root = doc.RootElement();
    for (auto si = root ? root->FirstChildElement("si") : nullptr; si; si = si->NextSiblingElement("si")) {
        std::string text;
        collect_text(si, text);
        values.push_back(std::move(text));
    }
    return values;
}

std::string resolve_target(const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }
    if (target.starts_with("xl/")) {
        return target;
    }
    return "xl/" + target;
}

struct WorkbookLayout {
    std::vector<SheetRef> sheets;
    bool date1904 = false;
};

WorkbookLayout load_workbook(ZipPackage& zip) {
    const std::string workbook_part = "xl/workbook.xml";
    const std::string rels_part = "xl/_rels/workbook.xml.rels";

    std::unordered_map<std::string, std::string> targets;
    if (zip.contains(rels_part)) {
        tinyxml2::XMLDocument rels;
        parse_xml(rels, zip.read(rels_part), rels_part);
        const auto* root = rels.RootElement();
        for (auto rel = root ? root->FirstChildElement("Relationship") : nullptr; rel;
             rel = rel->NextSiblingElement("Relationship")) {
            const char* id = rel->Attribute("Id");
            const char* target = rel->Attribute("Target");
            if (id && target) {
                targets[id] = resolve_target(target);
            }
        }
    }

    tinyxml2::XMLDocument workbook;
    parse_xml(workbook, zip.read(workbook_part), workbook_part);
    const auto* root = workbook.RootElement();
    const auto* sheets = root ? root->FirstChildElement("sheets") : nullptr;

    WorkbookLayout layout;
    if (const auto* pr = root ? root->FirstChildElement("workbookPr") : nullptr) {
        layout.date1904 = pr->BoolAttribute("date1904", false);
    }

    int position = 1;
    for (auto sheet = sheets ? sheets->FirstChildElement("sheet") : nullptr; sheet;
         sheet = sheet->NextSiblingElement("sheet"), ++position) {
        SheetRef ref;
        ref.name = sheet->Attribute("name") ? sheet->Attribute("name") : std::format("Sheet{}", position);

        const char* rid = sheet->Attribute("r:id");
        const auto it = rid ? targets.find(rid) : targets.end();
        ref.part = it != targets.end()
            ? it->second
            : std::format("xl/worksheets/sheet{}.xml", position);
        layout.sheets.push_back(std::move(ref));
    }
    return layout;
}

// Indexed by a cell's "s" attribute: whether that cell format shows a date
std::vector<bool> load_date_styles(ZipPackage& zip) {
    std::vector<bool> dates;
    const std::string part = "xl/styles.xml";
    if (!zip.contains(part)) {
        return dates;
    }

    tinyxml2::XMLDocument doc;
    parse_xml(doc, zip.read(part), part);
    const auto* root = doc.RootElement();
    if (!root) {
        return dates;
    }

    std::unordered_map<int, std::string> custom;
    if (const auto* formats = root->FirstChildElement("numFmts")) {
        for (auto fmt = formats->FirstChildElement("numFmt"); fmt; fmt = fmt->NextSiblingElement("numFmt")) {
            const char* code = fmt->Attribute("formatCode");
            custom[fmt->IntAttribute("numFmtId", -1)] = code ? code : "";
        }
    }

    const auto* xfs = root->FirstChildElement("cellXfs");
    for (auto xf = xfs ? xfs->FirstChildElement("xf") : nullptr; xf; xf = xf->NextSiblingElement("xf")) {
        const int id = xf->IntAttribute("numFmtId", 0);
        const auto it = custom.find(id);
        dates.push_back(XlsxExtractor::is_date_format(
            id, it != custom.end() ? std::string_view(it->second) : std::string_view{}));
    }
    return dates;
}

std::optional<double> parse_number(std::string_view text) {
    double value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

class XlsxRowStream : public ITextUnitStream {
public:
    explicit XlsxRowStream(const std::filesystem::path& path)
        : zip_(path),
          shared_(load_shared_strings(zip_)),
          date_styles_(load_date_styles(zip_)),
          layout_(load_workbook(zip_)) {}

    std::optional<TextUnit> next() override {
        while (lines_.empty()) {
            if (next_sheet_ >= layout_.sheets.size()) {
                return std::nullopt;
            }
            load_sheet(layout_.sheets[next_sheet_++]);
        }

        TextUnit unit;
        unit.text = std::move(lines_.front());
        lines_.pop_front();
        return unit;
    }

private:
    std::string cell_value(const tinyxml2::XMLElement* cell) const {
        const char* type = cell->Attribute("t");
        const auto* v = cell->FirstChildElement("v");
        const char* raw = v ? v->GetText() : nullptr;

        if (type && std::strcmp(type, "inlineStr") == 0) {
            std::string text;
            if (const auto* is = cell->FirstChildElement("is")) collect_text(is, text);
            return text;
        }
        if (!raw) {
            return {};
        }
        if (type && std::strcmp(type, "s") == 0) {
            const auto idx = utils::try_parse_int<size_t>(utils::trim(raw));
            if (!idx || *idx >= shared_.size()) {
                throw std::runtime_error(std::format("Shared string index out of range: {}", raw));
            }
            return shared_[*idx];
        }
        if (type && std::strcmp(type, "b") == 0) {
            return std::strcmp(raw, "1") == 0 ? "True" : "False";
        }
        if ((!type || std::strcmp(type, "n") == 0) && is_date_styled(cell)) {
            if (const auto serial = parse_number(utils::trim(raw))) {
                if (auto stamp = XlsxExtractor::format_serial_date(*serial, layout_.date1904)) {
                    return std::move(*stamp);
                }
            }
        }
        // Plain numbers, cached formula strings, ISO dates and errors
        return raw;
    }

    bool is_date_styled(const tinyxml2::XMLElement* cell) const {
        const int style = cell->IntAttribute("s", 0);
        return style >= 0 && static_cast<size_t>(style) < date_styles_.size() && date_styles_[style];
    }

    void load_sheet(const SheetRef& sheet) {
        if (!zip_.contains(sheet.part)) {
            utils::log::warn(std::format("Worksheet part {} for sheet '{}' is missing",
                sheet.part, sheet.name));
            return;
        }

        tinyxml2::XMLDocument doc;
        parse_xml(doc, zip_.read(sheet.part), sheet.part);
        const auto* root = doc.RootElement();
        const auto* data = root ? root->FirstChildElement("sheetData") : nullptr;
        if (!data) {
            return;
        }

        for (auto row = data->FirstChildElement("row"); row; row = row->NextSiblingElement("row")) {
            std::string line;
            int column = 0;
            for (auto cell = row->FirstChildElement("c"); cell; cell = cell->NextSiblingElement("c")) {
                const char* ref = cell->Attribute("r");
                const int parsed = ref ? XlsxExtractor::column_index(ref) : 0;
                column = parsed > 0 ? parsed : column + 1;

                const auto value = utils::trim(cell_value(cell));
                if (value.empty()) {
                    continue;
                }
                line += std::format(" | C{}:{}", column, value);
            }
            if (!line.empty()) {
                lines_.push_back(sheet.name + line);
            }
        }
    }

    ZipPackage zip_;
    std::vector<std::string> shared_;
    std::vector<bool> date_styles_;
    WorkbookLayout layout_;
    size_t next_sheet_ = 0;
    std::deque<std::string> lines_;
};

} // anonymous namespace

int XlsxExtractor::column_index(std::string_view cell_ref) {
    int column = 0;
    size_t i = 0;
    for (; i < cell_ref.size(); ++i) {
        const char c = cell_ref[i];
        if (c >= 'A' && c <= 'Z') {
            column = column * 26 + (c - 'A' + 1);
        } else if (c >= 'a' && c <= 'z') {
            column = column * 26 + (c - 'a' + 1);
        } else {
            break;
        }
    }
    if (i == 0 || i == cell_ref.size()) {
        return 0;
    }
    for (; i < cell_ref.size(); ++i) {
        if (cell_ref[i] < '0' || cell_ref[i] > '9') return 0;
    }
    return column;
}

bool XlsxExtractor::is_date_format(int num_fmt_id, std::string_view format_code) {
    if (format_code.empty()) {
        return (num_fmt_id >= 14 && num_fmt_id <= 22) || (num_fmt_id >= 45 && num_fmt_id <= 47);
    }

    // Only the positive-number section decides
    format_code = format_code.substr(0, format_code.find(';'));

    constexpr std::string_view kDateTokens = "dmhysDMHYS";
    char prev = '\0';
    for (size_t i = 0; i < format_code.size(); ++i) {
        const char c = format_code[i];
        if (c == '"') {
            const auto close = format_code.find('"', i + 1);
            if (close != std::string_view::npos) {
                i = close;
                continue;
            }
        } else if (c == '[') {
            // Colors and locales are skipped; elapsed-time markers like [h] still count
            const auto close = format_code.find(']', i + 1);
            if (close != std::string_view::npos) {
                const auto inner = format_code.substr(i + 1, close - i - 1);
                const bool elapsed = !inner.empty() && inner.size() <= 2 &&
                    inner.find_first_not_of(inner[0]) == std::string_view::npos &&
                    (inner[0] == 'h' || inner[0] == 'm' || inner[0] == 's');
                if (!elapsed) {
                    i = close;
                    continue;
                }
            }
        } else if (kDateTokens.find(c) != std::string_view::npos && prev != '_' && prev != '\\') {
            return true;
        }
        prev = c;
    }
    return false;
}

std::optional<std::string> XlsxExtractor::format_serial_date(double serial, bool date1904) {
    using namespace std::chrono;

    // Keeps the day arithmetic inside the range of year_month_day
    if (!std::isfinite(serial) || std::fabs(serial) > 4'000'000.0) {
        return std::nullopt;
    }

    const auto time_text = [](milliseconds ms) {
        const hh_mm_ss<milliseconds> t(ms);
        auto text = std::format("{:02}:{:02}:{:02}",
            t.hours().count(), t.minutes().count(), t.seconds().count());
        if (t.subseconds().count() != 0) {
            text += std::format(".{:06}", t.subseconds().count() * 1000);
        }
        return text;
    };

    const double whole = std::floor(serial);
    const milliseconds diff(static_cast<long long>(std::nearbyint((serial - whole) * 86'400'000.0)));

    // Pure fractions are a time of day
    if (serial >= 0 && serial < 1 && diff < days(1)) {
        return time_text(diff);
    }

    auto day_count = static_cast<long long>(whole);
    if (!date1904 && serial > 0 && serial < 60) {
        ++day_count;
    }

    const sys_days epoch = date1904 ? sys_days(year(1904) / January / 1)
                                    : sys_days(year(1899) / December / 30);
    const sys_time<milliseconds> stamp = sys_time<milliseconds>(epoch + days(day_count)) + diff;
    const auto date = std::chrono::floor<days>(stamp);
    const year_month_day ymd(date);
    if (ymd.year() < year(1) || ymd.year() > year(9999)) {
        return std::nullopt;
    }

    return std::format("{:04}-{:02}-{:02} ", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day())) +
           time_text(stamp - date);
}

std::unique_ptr<ITextUnitStream> XlsxExtractor::open(const std::filesystem::path& path) const {
    if (utils::to_lower(path.extension().string()) == ".xls") {
        throw std::runtime_error("Legacy binary .xls workbooks are not supported: " + path.string());
    }
    return std::make_unique<XlsxRowStream>(path);
}

} // namespace docshield
