#include "output/gzip_jsonl_reader.hpp"
#include "output/record_codec.hpp"

#include <format>
#include <stdexcept>
#include <unordered_set>

namespace docshield {

namespace {
constexpr unsigned kReadChunk = 1u << 15;
} // anonymous namespace

GzipJsonlReader::GzipJsonlReader(const std::string& path)
    : path_(path) {
    file_ = gzopen(path_.c_str(), "rb");
    if (!file_) {
        throw std::runtime_error("Failed to open record stream: " + path_);
    }
}

GzipJsonlReader::~GzipJsonlReader() {
    if (file_) {
        gzclose(file_);
    }
}

bool GzipJsonlReader::fill() {
    if (eof_) {
        return false;
    }

    // Drop consumed bytes before appending more
    if (pos_ > 0) {
        pending_.erase(0, pos_);
        pos_ = 0;
    }

    char buf[kReadChunk];
    const int n = gzread(file_, buf, kReadChunk);
    if (n > 0) {
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    eof_ = true;
    int errnum = Z_OK;
    const char* msg = gzerror(file_, &errnum);
    if (errnum == Z_BUF_ERROR) {
        truncated_ = true;
    } else if (n < 0 || (errnum != Z_OK && errnum != Z_STREAM_END)) {
        throw std::runtime_error(std::format("Read of {} failed: {}", path_,
            msg ? msg : "unknown zlib error"));
    }
    return false;
}

std::optional<std::string> GzipJsonlReader::next_line() {
    while (true) {
        const auto nl = pending_.find('\n', pos_);
        if (nl != std::string::npos) {
            std::string line = pending_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            return line;
        }
        if (!fill()) {
            if (pos_ < pending_.size()) {
                std::string line = pending_.substr(pos_);
                pos_ = pending_.size();
                return line;
            }
            return std::nullopt;
        }
    }
}

StreamVerification read_records(
    const std::string& path,
    const std::function<void(const Record&)>& fn) {

    StreamVerification report;
    std::unordered_set<std::string> documents;

    GzipJsonlReader reader(path);
    while (auto line = reader.next_line()) {
        ++report.lines;
        if (line->empty()) {
            ++report.invalid_records;
            if (report.errors.size() < StreamVerification::kMaxReportedErrors) {
                report.errors.push_back(std::format("line {}: empty line", report.lines));
            }
            continue;
        }

        auto parsed = parse_record(*line);
        if (parsed.is_error()) {
            ++report.invalid_records;
            if (report.errors.size() < StreamVerification::kMaxReportedErrors) {
                report.errors.push_back(
                    std::format("line {}: {}", report.lines, parsed.error_message()));
            }
            continue;
        }

        ++report.valid_records;
        documents.insert(parsed.value().document_id);
        if (fn) {
            fn(parsed.value());
        }
    }

    report.truncated = reader.truncated();
    report.documents = documents.size();
    return report;
}

} // namespace docshield
