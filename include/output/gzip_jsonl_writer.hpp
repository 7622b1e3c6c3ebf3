#pragma once

#include "output/record_sink.hpp"

#include <zlib.h>

#include <cstddef>
#include <string>

namespace docshield {

/**
 * @brief Append-only gzip JSON Lines record writer
 *
 * The stream is opened by the constructor and flushed and closed by the
 * destructor, so every exit path of a batch (including exceptions) leaves a
 * complete gzip member behind. The output path always ends in ".gz": a
 * missing suffix is appended ("out.jsonl" becomes "out.jsonl.gz").
 *
 * flush() issues a Z_SYNC_FLUSH, so a process killed mid-batch still leaves
 * a stream that decompresses up to the last flush.
 *
 * Not thread-safe; one writer per output path.
 */
class GzipJsonlWriter : public IRecordSink {
public:
    struct Config {
        std::string output_file = "chunks.jsonl.gz";
        int compression_level = 9;  // 0-9
    };

    /**
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument on an out-of-range compression level
     */
    explicit GzipJsonlWriter(const Config& config);
    ~GzipJsonlWriter() override;

    GzipJsonlWriter(const GzipJsonlWriter&) = delete;
    GzipJsonlWriter& operator=(const GzipJsonlWriter&) = delete;

    void write(const Record& record) override;
    void flush() override;
    void close() override;
    [[nodiscard]] std::string name() const override;

    /// Path actually written (with the canonical suffix)
    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] size_t records_written() const { return records_written_; }

    /// Append ".gz" unless the path already ends in it (case-insensitive)
    [[nodiscard]] static std::string canonical_path(const std::string& path);

private:
    void write_raw(const std::string& data);
    [[nodiscard]] std::string last_error() const;

    std::string path_;
    gzFile file_ = nullptr;
    size_t records_written_ = 0;
};

} // namespace docshield
