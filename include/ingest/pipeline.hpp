#pragma once

#include "core/anonymizer.hpp"
#include "core/chunker.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "extract/extractor_registry.hpp"
#include "output/record_sink.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

struct PipelineOptions {
    size_t max_chars_per_chunk = TextChunker::kDefaultMaxChars;
    size_t jobs = 1;    ///< files processed concurrently
};

enum class FileStatus {
    PROCESSED,
    SKIPPED,
    FAILED
};

inline constexpr const char* file_status_to_string(FileStatus status) {
    switch (status) {
        case FileStatus::PROCESSED: return "processed";
        case FileStatus::SKIPPED:   return "skipped";
        case FileStatus::FAILED:    return "failed";
    }
    return "failed";
}

/**
 * @brief Outcome for one input file
 */
struct FileReport {
    std::string path;
    std::string document_id;        ///< empty when the file was skipped early
    FileStatus status = FileStatus::PROCESSED;
    size_t record_count = 0;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string reason;
};

/**
 * @brief Batch totals folded from FileReports
 */
struct BatchSummary {
    size_t discovered = 0;
    size_t processed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t records = 0;
    std::vector<FileReport> files;
};

[[nodiscard]] BatchSummary summarize(std::vector<FileReport> reports);

/**
 * @brief All records staged for one file, ready to be written
 */
struct FileRecords {
    std::string document_id;
    std::string file_sha256;
    std::vector<Record> records;
};

/**
 * @brief Drives files through extraction, chunking and anonymization
 *
 * PDF pages are chunked first and each chunk is anonymized on its own.
 * Spreadsheet rows are packed into a line buffer until it reaches
 * max_chars_per_chunk (each line counting its length plus one), then the
 * whole buffer is anonymized as one record.
 *
 * A file either yields all of its records or none: records are staged per
 * file and handed to the sink only after the file succeeded. Sink errors
 * are not caught and abort the batch.
 */
class IngestPipeline {
public:
    /**
     * @throws std::invalid_argument if max_chars_per_chunk or jobs is 0
     */
    IngestPipeline(const AnonymizationEngine& engine,
                   const ExtractorRegistry& registry,
                   PipelineOptions options = {});

    /**
     * @brief Extract, chunk and anonymize one file without writing anything
     *
     * UNSUPPORTED_FORMAT means no extractor handles the extension; every
     * other error category is a failure of that file.
     */
    [[nodiscard]] Result<FileRecords> process_file(const std::filesystem::path& path) const;

    /**
     * @brief Process `files` in order, writing their records to `sink`
     * @throws std::runtime_error (or anything the sink throws) on output failure
     */
    BatchSummary run(const std::vector<std::filesystem::path>& files, IRecordSink& sink) const;

    [[nodiscard]] const PipelineOptions& options() const { return options_; }

private:
    // `stage` tracks the phase in progress so failures are categorized
    void collect_paged(ITextUnitStream& units, const Record& base,
                       std::vector<Record>& out, ErrorCategory& stage) const;
    void collect_tabular(ITextUnitStream& units, const Record& base,
                         std::vector<Record>& out, ErrorCategory& stage) const;
    void append_record(const Record& base, std::optional<int> page_number,
                       size_t chunk_index, std::string_view chunk,
                       std::vector<Record>& out, ErrorCategory& stage) const;

    FileReport deliver(const std::filesystem::path& path,
                       Result<FileRecords> result, IRecordSink& sink) const;

    const AnonymizationEngine& engine_;
    const ExtractorRegistry& registry_;
    PipelineOptions options_;
    TextChunker chunker_;
};

} // namespace docshield
