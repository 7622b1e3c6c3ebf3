#include "output/gzip_jsonl_writer.hpp"
#include "output/record_codec.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace docshield {

GzipJsonlWriter::GzipJsonlWriter(const Config& config)
    : path_(canonical_path(config.output_file)) {

    if (config.compression_level < 0 || config.compression_level > 9) {
        throw std::invalid_argument(
            std::format("compression level must be 0-9, got {}", config.compression_level));
    }

    const std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error(std::format("Failed to create output directory {}: {}",
                p.parent_path().string(), ec.message()));
        }
    }

    const auto mode = std::format("wb{}", config.compression_level);
    file_ = gzopen(path_.c_str(), mode.c_str());
    if (!file_) {
        throw std::runtime_error("Failed to open output file: " + path_);
    }
}

GzipJsonlWriter::~GzipJsonlWriter() {
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Closing {} failed: {}", path_, e.what()));
    }
}

void GzipJsonlWriter::write(const Record& record) {
    if (!file_) {
        throw std::runtime_error("write to closed output: " + path_);
    }
    std::string line = serialize_record(record);
    line += '\n';
    write_raw(line);
    ++records_written_;
}

void GzipJsonlWriter::write_raw(const std::string& data) {
    const int written = gzwrite(file_, data.data(), static_cast<unsigned>(data.size()));
    if (written <= 0 || static_cast<size_t>(written) != data.size()) {
        throw std::runtime_error(std::format("Write to {} failed: {}", path_, last_error()));
    }
}

void GzipJsonlWriter::flush() {
    if (!file_) {
        return;
    }
    if (gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
        throw std::runtime_error(std::format("Flush of {} failed: {}", path_, last_error()));
    }
}

void GzipJsonlWriter::close() {
    if (!file_) {
        return;
    }
    gzFile file = file_;
    file_ = nullptr;
    const int rc = gzclose(file);
    if (rc != Z_OK) {
        throw std::runtime_error(std::format("Close of {} failed (zlib error {})", path_, rc));
    }
}

std::string GzipJsonlWriter::name() const {
    return "gzip:" + path_;
}

std::string GzipJsonlWriter::canonical_path(const std::string& path) {
    const auto ext = utils::to_lower(std::filesystem::path(path).extension().string());
    if (ext == ".gz") {
        return path;
    }
    return path + ".gz";
}

std::string GzipJsonlWriter::last_error() const {
    int errnum = Z_OK;
    const char* msg = file_ ? gzerror(file_, &errnum) : nullptr;
    return msg ? std::string(msg) : std::string("unknown zlib error");
}

} // namespace docshield
