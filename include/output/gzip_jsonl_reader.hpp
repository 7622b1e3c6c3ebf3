#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <zlib.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

/**
 * @brief Line reader over a gzip (or plain) JSON Lines file
 *
 * zlib reads uncompressed input transparently. A stream cut off after a
 * sync flush yields every complete line before the cut.
 */
class GzipJsonlReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit GzipJsonlReader(const std::string& path);
    ~GzipJsonlReader();

    GzipJsonlReader(const GzipJsonlReader&) = delete;
    GzipJsonlReader& operator=(const GzipJsonlReader&) = delete;

    /// Next line without its newline; nullopt at end of stream
    [[nodiscard]] std::optional<std::string> next_line();

    /// True when the stream ended early (truncated gzip member)
    [[nodiscard]] bool truncated() const { return truncated_; }

private:
    bool fill();

    std::string path_;
    gzFile file_ = nullptr;
    std::string pending_;
    size_t pos_ = 0;
    bool eof_ = false;
    bool truncated_ = false;
};

/**
 * @brief Result of validating a record stream
 */
struct StreamVerification {
    size_t lines = 0;
    size_t valid_records = 0;
    size_t invalid_records = 0;
    size_t documents = 0;             ///< distinct document_id values
    bool truncated = false;
    std::vector<std::string> errors;  ///< first kMaxReportedErrors problems

    static constexpr size_t kMaxReportedErrors = 20;

    [[nodiscard]] bool ok() const { return invalid_records == 0 && !truncated; }
};

/**
 * @brief Decode every record in `path`, calling `fn` for each valid one
 * @throws std::runtime_error if the file cannot be opened
 */
StreamVerification read_records(
    const std::string& path,
    const std::function<void(const Record&)>& fn = nullptr);

} // namespace docshield
