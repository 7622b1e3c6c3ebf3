#include "ingest/pipeline.hpp"
#include "ingest/file_discovery.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <stdexcept>

namespace docshield {

BatchSummary summarize(std::vector<FileReport> reports) {
    BatchSummary summary;
    summary.discovered = reports.size();
    for (const auto& report : reports) {
        switch (report.status) {
            case FileStatus::PROCESSED: ++summary.processed; break;
            case FileStatus::SKIPPED:   ++summary.skipped; break;
            case FileStatus::FAILED:    ++summary.failed; break;
        }
        summary.records += report.record_count;
    }
    summary.files = std::move(reports);
    return summary;
}

IngestPipeline::IngestPipeline(
    const AnonymizationEngine& engine,
    const ExtractorRegistry& registry,
    PipelineOptions options)
    : engine_(engine),
      registry_(registry),
      options_(options),
      chunker_(options.max_chars_per_chunk) {
    if (options_.jobs == 0) {
        throw std::invalid_argument("jobs must be at least 1");
    }
}

Result<FileRecords> IngestPipeline::process_file(const std::filesystem::path& path) const {
    const IExtractor* extractor = registry_.find(path);
    if (!extractor) {
        return Result<FileRecords>::error(ErrorCategory::UNSUPPORTED_FORMAT,
            std::format("Unsupported file type: {}", path.string()));
    }

    // Tracks which phase an exception escaped from
    ErrorCategory stage = ErrorCategory::IO_ERROR;
    try {
        FileRecords staged;
        staged.file_sha256 = compute_file_sha256(path);
        staged.document_id = utils::generate_uuid();

        Record base;
        base.document_id = staged.document_id;
        base.source_path = path.string();
        base.file_sha256 = staged.file_sha256;
        base.file_type = extractor->document_type();

        stage = ErrorCategory::EXTRACTION_ERROR;
        auto units = extractor->open(path);

        if (base.file_type == DocumentType::PDF) {
            collect_paged(*units, base, staged.records, stage);
        } else {
            collect_tabular(*units, base, staged.records, stage);
        }
        return Result<FileRecords>::ok(std::move(staged));
    } catch (const std::exception& e) {
        return Result<FileRecords>::error(stage,
            std::format("{}: {}", path.string(), e.what()));
    }
}

void IngestPipeline::append_record(
    const Record& base, std::optional<int> page_number,
    size_t chunk_index, std::string_view chunk,
    std::vector<Record>& out, ErrorCategory& stage) const {

    stage = ErrorCategory::ANONYMIZATION_ERROR;
    auto anonymized = engine_.anonymize(chunk);

    Record record = base;
    record.page_number = page_number;
    record.chunk_index = chunk_index;
    record.text = std::move(anonymized.text);
    record.entities = std::move(anonymized.entities);
    out.push_back(std::move(record));
}

void IngestPipeline::collect_paged(
    ITextUnitStream& units, const Record& base,
    std::vector<Record>& out, ErrorCategory& stage) const {

    while (true) {
        stage = ErrorCategory::EXTRACTION_ERROR;
        auto unit = units.next();
        if (!unit) {
            break;
        }
        if (unit->text.empty()) {
            continue;
        }

        stage = ErrorCategory::CHUNKING_ERROR;
        auto chunks = chunker_.chunk(std::move(unit->text));
        size_t chunk_index = 0;
        while (auto chunk = chunks.next()) {
            append_record(base, unit->page_number, chunk_index++, *chunk, out, stage);
            stage = ErrorCategory::CHUNKING_ERROR;
        }
    }
}

void IngestPipeline::collect_tabular(
    ITextUnitStream& units, const Record& base,
    std::vector<Record>& out, ErrorCategory& stage) const {

    std::string buffer;
    size_t buffered_chars = 0;
    size_t chunk_index = 0;

    while (true) {
        stage = ErrorCategory::EXTRACTION_ERROR;
        auto unit = units.next();
        if (!unit) {
            break;
        }
        if (!unit->text.empty()) {
            if (!buffer.empty()) {
                buffer += '\n';
            }
            buffer += unit->text;
            buffered_chars += utils::utf8_length(unit->text) + 1;
        }
        if (buffered_chars >= options_.max_chars_per_chunk) {
            append_record(base, std::nullopt, chunk_index++, buffer, out, stage);
            buffer.clear();
            buffered_chars = 0;
        }
    }

    if (!buffer.empty()) {
        append_record(base, std::nullopt, chunk_index, buffer, out, stage);
    }
}

FileReport IngestPipeline::deliver(
    const std::filesystem::path& path,
    Result<FileRecords> result, IRecordSink& sink) const {

    FileReport report;
    report.path = path.string();

    if (result.is_error()) {
        report.error_category = result.error_category();
        report.reason = result.error_message();
        if (result.error_category() == ErrorCategory::UNSUPPORTED_FORMAT) {
            report.status = FileStatus::SKIPPED;
            utils::log::warn(std::format("Skipping {}", report.reason));
        } else {
            report.status = FileStatus::FAILED;
            utils::log::error(std::format("Failed to process {} [{}]",
                report.reason, error_category_to_string(report.error_category)));
        }
        return report;
    }

    auto& staged = result.value();
    for (const auto& record : staged.records) {
        sink.write(record);
    }
    sink.flush();

    report.status = FileStatus::PROCESSED;
    report.document_id = staged.document_id;
    report.record_count = staged.records.size();
    utils::log::debug(std::format("{}: {} records (document {})",
        report.path, report.record_count, report.document_id));
    return report;
}

BatchSummary IngestPipeline::run(
    const std::vector<std::filesystem::path>& files, IRecordSink& sink) const {

    std::vector<FileReport> reports;
    reports.reserve(files.size());

    if (options_.jobs <= 1) {
        for (const auto& path : files) {
            reports.push_back(deliver(path, process_file(path), sink));
        }
        return summarize(std::move(reports));
    }

    // Bounded windows: extraction runs concurrently, writing stays here and
    // in discovery order
    for (size_t window = 0; window < files.size(); window += options_.jobs) {
        const size_t end = std::min(files.size(), window + options_.jobs);

        std::vector<std::future<Result<FileRecords>>> pending;
        pending.reserve(end - window);
        for (size_t i = window; i < end; ++i) {
            pending.push_back(std::async(std::launch::async,
                [this, &path = files[i]] { return process_file(path); }));
        }

        for (size_t i = window; i < end; ++i) {
            reports.push_back(deliver(files[i], pending[i - window].get(), sink));
        }
    }
    return summarize(std::move(reports));
}

} // namespace docshield
