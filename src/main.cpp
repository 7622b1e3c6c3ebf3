#include "config/cli_args.hpp"
#include "config/config_loader.hpp"
#include "core/anonymizer.hpp"
#include "core/utils.hpp"
#include "extract/extractor_registry.hpp"
#include "ingest/file_discovery.hpp"
#include "ingest/pipeline.hpp"
#include "output/gzip_jsonl_reader.hpp"
#include "output/gzip_jsonl_writer.hpp"

#include <cstdlib>
#include <format>
#include <iostream>

using namespace docshield;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitConfig = 2;

int run_ingest(const CliArgs& args) {
    auto config_result = resolve_ingest_config(args);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitConfig;
    }
    const auto& cfg = config_result.config;

    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    std::vector<std::filesystem::path> inputs(cfg.ingest.inputs.begin(), cfg.ingest.inputs.end());
    const auto files = discover_input_files(inputs);
    if (files.empty()) {
        utils::log::error("No input files found");
        return kExitConfig;
    }
    utils::log::info(std::format("Discovered {} files", files.size()));

    try {
        const auto policy = overlap_policy_from_string(cfg.anonymization.overlap_policy)
            .value_or(OverlapPolicy::APPLY_ALL);
        const AnonymizationEngine engine(
            PatternCatalog::default_catalog(),
            Pseudonymizer(cfg.anonymization.secret),
            policy);

        ExtractionOptions extraction;
        extraction.ocr = cfg.ingest.ocr;
        const auto registry = ExtractorRegistry::with_builtin_extractors(extraction);

        PipelineOptions options;
        options.max_chars_per_chunk = cfg.ingest.max_chars_per_chunk;
        options.jobs = cfg.ingest.jobs;
        const IngestPipeline pipeline(engine, registry, options);

        GzipJsonlWriter::Config writer_config;
        writer_config.output_file = cfg.ingest.output;
        writer_config.compression_level = cfg.output.compression_level;
        GzipJsonlWriter writer(writer_config);

        utils::Timer timer;
        const auto summary = pipeline.run(files, writer);
        writer.close();

        utils::log::info(std::format(
            "{} processed, {} skipped, {} failed, {} records in {}ms",
            summary.processed, summary.skipped, summary.failed, summary.records,
            timer.elapsed_ms().count()));
        utils::log::info(std::format("Done. Wrote {}", writer.path()));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFatal;
    }

    return kExitOk;
}

int run_verify(const CliArgs& args) {
    try {
        const auto report = read_records(args.verify_path);
        for (const auto& err : report.errors) {
            utils::log::warn(err);
        }
        if (report.truncated) {
            utils::log::warn(std::format("{} ends mid-stream (truncated gzip member)", args.verify_path));
        }
        utils::log::info(std::format("{}: {} records from {} documents, {} invalid lines",
            args.verify_path, report.valid_records, report.documents, report.invalid_records));
        return report.ok() ? kExitOk : kExitFatal;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFatal;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto parsed = parse_cli_args(argc, argv);
    if (!parsed.success) {
        utils::log::error(parsed.error_message);
        std::cerr << usage_text();
        return kExitConfig;
    }

    if (parsed.args.log_level) {
        if (const auto level = utils::log::parse_level(*parsed.args.log_level)) {
            utils::log::set_level(*level);
        }
    }

    switch (parsed.args.command) {
        case CliCommand::HELP:
            std::cout << usage_text();
            return kExitOk;
        case CliCommand::VERIFY:
            return run_verify(parsed.args);
        case CliCommand::INGEST:
            break;
    }
    return run_ingest(parsed.args);
}
