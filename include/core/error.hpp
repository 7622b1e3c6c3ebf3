#pragma once

#include <string>
#include <optional>

namespace docshield {

/**
 * @brief Error categories for per-file processing
 */
enum class ErrorCategory {
    NONE,
    UNSUPPORTED_FORMAT,
    IO_ERROR,
    EXTRACTION_ERROR,
    ANONYMIZATION_ERROR,
    CHUNKING_ERROR,
    INVALID_RECORD
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::UNSUPPORTED_FORMAT:  return "unsupported_format";
        case ErrorCategory::IO_ERROR:            return "io_error";
        case ErrorCategory::EXTRACTION_ERROR:    return "extraction_error";
        case ErrorCategory::ANONYMIZATION_ERROR: return "anonymization_error";
        case ErrorCategory::CHUNKING_ERROR:      return "chunking_error";
        case ErrorCategory::INVALID_RECORD:      return "invalid_record";
    }
    return "none";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace docshield
