#include <catch2/catch_test_macros.hpp>
#include "extract/command_runner.hpp"
#include "extract/extractor_registry.hpp"
#include "extract/pdf_extractor.hpp"
#include "mocks/mock_extractor.hpp"
#include "test_support.hpp"

#ifdef ENABLE_XLSX
#include "extract/xlsx_extractor.hpp"
#include "ingest/pipeline.hpp"
#include "mocks/memory_record_sink.hpp"
#include <miniz.h>
#include <cstring>
#endif

#include <stdexcept>

using namespace docshield;
using docshield::test::MockExtractor;
using docshield::test::TempDir;

// ============================================================================
// ExtractorRegistry
// ============================================================================

TEST_CASE("Registry resolves extensions case-insensitively", "[extract][registry]") {
    ExtractorRegistry registry;
    auto pdf = std::make_shared<MockExtractor>(DocumentType::PDF, std::vector<TextUnit>{});
    auto sheet = std::make_shared<MockExtractor>(DocumentType::EXCEL, std::vector<TextUnit>{});
    registry.register_extractor({".pdf"}, pdf);
    registry.register_extractor({".XLSX", ".xlsm"}, sheet);

    CHECK(registry.size() == 3);
    CHECK(registry.find("report.PDF") == pdf.get());
    CHECK(registry.find("dir/book.xlsx") == sheet.get());
    CHECK(registry.find("book.XlSm") == sheet.get());
    CHECK(registry.find("notes.txt") == nullptr);
    CHECK(registry.find("no_extension") == nullptr);
}

TEST_CASE("Supported extensions cover PDF and spreadsheets", "[extract][registry]") {
    CHECK(ExtractorRegistry::is_supported_extension("a.pdf"));
    CHECK(ExtractorRegistry::is_supported_extension("a.XLS"));
    CHECK(ExtractorRegistry::is_supported_extension("a.xlsx"));
    CHECK(ExtractorRegistry::is_supported_extension("a.xlsm"));
    CHECK_FALSE(ExtractorRegistry::is_supported_extension("a.docx"));
    CHECK_FALSE(ExtractorRegistry::is_supported_extension("pdf"));
}

TEST_CASE("Built-in registry always handles PDF", "[extract][registry]") {
    const auto registry = ExtractorRegistry::with_builtin_extractors(ExtractionOptions{});
    const auto* pdf = registry.find("x.pdf");
    REQUIRE(pdf != nullptr);
    CHECK(pdf->document_type() == DocumentType::PDF);
    CHECK(pdf->name() == "pdf");
#ifdef ENABLE_XLSX
    REQUIRE(registry.find("x.xlsx") != nullptr);
    CHECK(registry.find("x.xlsx")->document_type() == DocumentType::EXCEL);
#else
    CHECK(registry.find("x.xlsx") == nullptr);
#endif
}

// ============================================================================
// Command runner
// ============================================================================

TEST_CASE("Shell quoting survives embedded quotes", "[extract][command]") {
    CHECK(command::shell_quote("plain") == "'plain'");
    CHECK(command::shell_quote("it's") == "'it'\\''s'");
    CHECK(command::shell_quote("") == "''");

    const auto echoed = command::run("printf '%s' " + command::shell_quote("it's $HOME"));
    REQUIRE(echoed.ok());
    CHECK(echoed.output == "it's $HOME");
}

TEST_CASE("Command runner captures stdout and exit status", "[extract][command]") {
    const auto ok = command::run("printf 'a\\nb'");
    CHECK(ok.ok());
    CHECK(ok.output == "a\nb");

    const auto failed = command::run("exit 3");
    CHECK(failed.exit_code == 3);
    CHECK_FALSE(failed.ok());

    CHECK(command::has_tool("sh"));
    CHECK_FALSE(command::has_tool("docshield-no-such-tool"));
}

TEST_CASE("Temp file paths are unique", "[extract][command]") {
    const auto a = command::temp_file_path(".png");
    const auto b = command::temp_file_path(".png");
    CHECK(a != b);
    CHECK(a.extension() == ".png");
}

// ============================================================================
// PdfExtractor
// ============================================================================

TEST_CASE("pdfinfo page count parsing", "[extract][pdf]") {
    CHECK(PdfExtractor::parse_page_count("Title: x\nPages:          12\nEncrypted: no\n") == 12);
    CHECK(PdfExtractor::parse_page_count("Pages: 0\n") == 0);
    CHECK_FALSE(PdfExtractor::parse_page_count("Title: x\n").has_value());
    CHECK_FALSE(PdfExtractor::parse_page_count("Pages: many\n").has_value());
}

TEST_CASE("Opening an unreadable PDF throws", "[extract][pdf]") {
    TempDir dir;
    const PdfExtractor extractor;
    CHECK_THROWS_AS(extractor.open(dir.path() / "missing.pdf"), std::runtime_error);
    CHECK_THROWS_AS(extractor.open(dir.write_file("fake.pdf", "not a pdf")), std::runtime_error);
}

#ifdef ENABLE_XLSX

// ============================================================================
// XlsxExtractor
// ============================================================================

namespace {

void add_part(mz_zip_archive& zip, const char* name, const std::string& body) {
    REQUIRE(mz_zip_writer_add_mem(&zip, name, body.data(), body.size(), MZ_DEFAULT_COMPRESSION));
}

std::filesystem::path write_workbook(const TempDir& dir) {
    const auto path = dir.path() / "book.xlsx";
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    REQUIRE(mz_zip_writer_init_file(&zip, path.string().c_str(), 0));

    add_part(zip, "xl/workbook.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<workbook xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)"
        R"(<sheets><sheet name="People" sheetId="1" r:id="rId1"/>)"
        R"(<sheet name="Notes" sheetId="2" r:id="rId2"/></sheets></workbook>)");
    add_part(zip, "xl/_rels/workbook.xml.rels",
        R"(<?xml version="1.0" encoding="UTF-8"?><Relationships>)"
        R"(<Relationship Id="rId1" Target="worksheets/sheet1.xml"/>)"
        R"(<Relationship Id="rId2" Target="/xl/worksheets/notes.xml"/></Relationships>)");
    add_part(zip, "xl/sharedStrings.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?><sst>)"
        R"(<si><t>Name</t></si>)"
        R"(<si><r><t>Ali</t></r><r><t>ce</t></r></si>)"
        R"(<si><t>a@b.com</t></si></sst>)");
    add_part(zip, "xl/worksheets/sheet1.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?><worksheet><sheetData>)"
        R"(<row r="1"><c r="A1" t="s"><v>0</v></c><c r="C1" t="inlineStr"><is><t>Email</t></is></c></row>)"
        R"(<row r="2"><c r="A2" t="s"><v>1</v></c><c r="B2"><v>42</v></c>)"
        R"(<c r="C2" t="s"><v>2</v></c><c r="D2" t="b"><v>1</v></c></row>)"
        R"(<row r="3"><c r="A3"/></row>)"
        R"(</sheetData></worksheet>)");
    add_part(zip, "xl/worksheets/notes.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?><worksheet><sheetData>)"
        R"(<row r="1"><c r="B1" t="str"><v>ok</v></c></row>)"
        R"(</sheetData></worksheet>)");

    REQUIRE(mz_zip_writer_finalize_archive(&zip));
    REQUIRE(mz_zip_writer_end(&zip));
    return path;
}

// One sheet "Dates"; B1 holds `joined_serial` under the built-in short date style
std::filesystem::path write_dated_workbook(const TempDir& dir, const std::string& joined_serial,
                                           bool date1904 = false) {
    const auto path = dir.path() / "dates.xlsx";
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    REQUIRE(mz_zip_writer_init_file(&zip, path.string().c_str(), 0));

    add_part(zip, "xl/workbook.xml",
        std::string(R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<workbook xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)") +
        (date1904 ? R"(<workbookPr date1904="1"/>)" : "") +
        R"(<sheets><sheet name="Dates" sheetId="1" r:id="rId1"/></sheets></workbook>)");
    add_part(zip, "xl/_rels/workbook.xml.rels",
        R"(<?xml version="1.0" encoding="UTF-8"?><Relationships>)"
        R"(<Relationship Id="rId1" Target="worksheets/sheet1.xml"/></Relationships>)");
    // xf 0 General, 1 built-in m/d/yyyy, 2 custom date-time, 3 built-in 0.00
    add_part(zip, "xl/styles.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?><styleSheet>)"
        R"(<numFmts count="1"><numFmt numFmtId="164" formatCode="yyyy\-mm\-dd hh:mm"/></numFmts>)"
        R"(<cellXfs count="4"><xf numFmtId="0"/><xf numFmtId="14"/><xf numFmtId="164"/>)"
        R"(<xf numFmtId="2"/></cellXfs></styleSheet>)");
    add_part(zip, "xl/worksheets/sheet1.xml",
        R"(<?xml version="1.0" encoding="UTF-8"?><worksheet><sheetData>)"
        R"(<row r="1"><c r="A1" t="inlineStr"><is><t>Joined</t></is></c>)"
        R"(<c r="B1" s="1"><v>)" + joined_serial + R"(</v></c>)"
        R"(<c r="C1" s="2"><v>0.75</v></c><c r="D1" s="3"><v>12.5</v></c></row>)"
        R"(<row r="2"><c r="A2" t="inlineStr"><is><t>Lunch</t></is></c>)"
        R"(<c r="B2" s="2" t="n"><v>45296.5</v></c></row>)"
        R"(</sheetData></worksheet>)");

    REQUIRE(mz_zip_writer_finalize_archive(&zip));
    REQUIRE(mz_zip_writer_end(&zip));
    return path;
}

std::vector<std::string> read_lines(const XlsxExtractor& extractor, const std::filesystem::path& path) {
    auto units = extractor.open(path);
    std::vector<std::string> lines;
    while (auto unit = units->next()) {
        lines.push_back(unit->text);
    }
    return lines;
}

} // anonymous namespace


TEST_CASE("Cell references map to 1-based columns", "[extract][xlsx]") {
    CHECK(XlsxExtractor::column_index("A1") == 1);
    CHECK(XlsxExtractor::column_index("C7") == 3);
    CHECK(XlsxExtractor::column_index("Z3") == 26);
    CHECK(XlsxExtractor::column_index("AA10") == 27);
    CHECK(XlsxExtractor::column_index("ab2") == 28);
    CHECK(XlsxExtractor::column_index("A") == 0);
    CHECK(XlsxExtractor::column_index("12") == 0);
    CHECK(XlsxExtractor::column_index("B2x") == 0);
}

TEST_CASE("Workbook rows flatten to one unit each, sheet by sheet", "[extract][xlsx]") {
    TempDir dir;
    const XlsxExtractor extractor;
    auto units = extractor.open(write_workbook(dir));

    std::vector<std::string> lines;
    while (auto unit = units->next()) {
        CHECK_FALSE(unit->page_number.has_value());
        lines.push_back(unit->text);
    }

    CHECK(lines == std::vector<std::string>{
        "People | C1:Name | C3:Email",
        "People | C1:Alice | C2:42 | C3:a@b.com | C4:True",
        "Notes | C2:ok",
    });
}

TEST_CASE("Spreadsheet extraction rejects legacy and broken files", "[extract][xlsx]") {
    TempDir dir;
    const XlsxExtractor extractor;
    CHECK_THROWS_AS(extractor.open(dir.write_file("old.xls", "\xD0\xCF\x11\xE0")), std::runtime_error);
    CHECK_THROWS_AS(extractor.open(dir.write_file("broken.xlsx", "not a zip")), std::runtime_error);
}

TEST_CASE("Date formats are recognized by id and by format code", "[extract][xlsx][dates]") {
    CHECK(XlsxExtractor::is_date_format(14));
    CHECK(XlsxExtractor::is_date_format(22));
    CHECK(XlsxExtractor::is_date_format(45));
    CHECK(XlsxExtractor::is_date_format(47));
    CHECK_FALSE(XlsxExtractor::is_date_format(0));
    CHECK_FALSE(XlsxExtractor::is_date_format(2));
    CHECK_FALSE(XlsxExtractor::is_date_format(23));
    CHECK_FALSE(XlsxExtractor::is_date_format(164));

    CHECK(XlsxExtractor::is_date_format(164, "yyyy-mm-dd hh:mm"));
    CHECK(XlsxExtractor::is_date_format(165, "[h]:mm:ss"));
    CHECK(XlsxExtractor::is_date_format(166, "[$-409]d-mmm;@"));
    CHECK_FALSE(XlsxExtractor::is_date_format(167, "0.00"));
    CHECK_FALSE(XlsxExtractor::is_date_format(168, "[Red]#,##0"));
    CHECK_FALSE(XlsxExtractor::is_date_format(169, "\"Total\" 0"));
    CHECK_FALSE(XlsxExtractor::is_date_format(170, "#,##0_);(#,##0)"));
    CHECK_FALSE(XlsxExtractor::is_date_format(171, "\\d0"));
    CHECK_FALSE(XlsxExtractor::is_date_format(172, "0;\"days\" 0"));
}

TEST_CASE("Serial dates render as calendar timestamps", "[extract][xlsx][dates]") {
    CHECK(XlsxExtractor::format_serial_date(45296) == "2024-01-05 00:00:00");
    CHECK(XlsxExtractor::format_serial_date(45296.5) == "2024-01-05 12:00:00");
    CHECK(XlsxExtractor::format_serial_date(33005) == "1990-05-12 00:00:00");
    CHECK(XlsxExtractor::format_serial_date(0.75) == "18:00:00");

    SECTION("serials before March 1900 absorb the phantom leap day") {
        CHECK(XlsxExtractor::format_serial_date(1) == "1900-01-01 00:00:00");
        CHECK(XlsxExtractor::format_serial_date(59) == "1900-02-28 00:00:00");
        CHECK(XlsxExtractor::format_serial_date(60) == "1900-02-28 00:00:00");
        CHECK(XlsxExtractor::format_serial_date(61) == "1900-03-01 00:00:00");
    }

    SECTION("1904 date system") {
        CHECK(XlsxExtractor::format_serial_date(43834, true) == "2024-01-05 00:00:00");
        CHECK(XlsxExtractor::format_serial_date(0, true) == "00:00:00");
    }

    SECTION("out of range") {
        CHECK_FALSE(XlsxExtractor::format_serial_date(1e12).has_value());
        CHECK_FALSE(XlsxExtractor::format_serial_date(-700000).has_value());
    }
}

TEST_CASE("Date-styled cells are extracted as timestamps", "[extract][xlsx][dates]") {
    TempDir dir;
    const XlsxExtractor extractor;

    SECTION("1900 date system") {
        CHECK(read_lines(extractor, write_dated_workbook(dir, "45296")) == std::vector<std::string>{
            "Dates | C1:Joined | C2:2024-01-05 00:00:00 | C3:18:00:00 | C4:12.5",
            "Dates | C1:Lunch | C2:2024-01-05 12:00:00",
        });
    }

    SECTION("1904 date system") {
        const auto lines = read_lines(extractor, write_dated_workbook(dir, "43834", true));
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "Dates | C1:Joined | C2:2024-01-05 00:00:00 | C3:18:00:00 | C4:12.5");
    }
}

TEST_CASE("Spreadsheet dates are pseudonymized by the pipeline", "[extract][xlsx][dates][pipeline]") {
    TempDir dir;
    const auto file = write_dated_workbook(dir, "45296");

    ExtractorRegistry registry;
    registry.register_extractor({".xlsx"}, std::make_shared<XlsxExtractor>());
    const AnonymizationEngine engine(PatternCatalog::default_catalog(), Pseudonymizer("k1"));
    const IngestPipeline pipeline(engine, registry);

    docshield::test::MemoryRecordSink sink;
    const auto summary = pipeline.run({file}, sink);

    CHECK(summary.processed == 1);
    REQUIRE(sink.records.size() == 1);
    const auto& r = sink.records[0];
    CHECK(r.text ==
          "Dates | C1:Joined | C2:<DATE:c4f5e48633d3c4a5> 00:00:00 | C3:18:00:00 | C4:12.5\n"
          "Dates | C1:Lunch | C2:<DATE:c4f5e48633d3c4a5> 12:00:00");
    REQUIRE(r.entities.size() == 2);
    CHECK(r.entities[0] == EntityMatch{EntityCategory::DATE, 23, 33});
    CHECK(r.entities[1] == EntityMatch{EntityCategory::DATE, 89, 99});
}

#endif // ENABLE_XLSX
