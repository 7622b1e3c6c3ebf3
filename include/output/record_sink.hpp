#pragma once

#include "core/types.hpp"
#include <string>

namespace docshield {

/**
 * @brief Abstract interface for record output destinations
 *
 * A sink has exactly one writer for its lifetime. Implementations throw on
 * any I/O failure; the pipeline treats that as fatal for the batch.
 */
class IRecordSink {
public:
    virtual ~IRecordSink() = default;

    /// Append one record. Records are never rewritten once written.
    virtual void write(const Record& record) = 0;

    /// Make everything written so far durable and readable.
    virtual void flush() = 0;

    /// Flush and release the underlying handle. Idempotent.
    virtual void close() = 0;

    /// Human-readable sink name for logging (e.g. "gzip:/data/out.jsonl.gz")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace docshield
