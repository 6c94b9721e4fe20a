#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace kickqr {

/**
 * @brief Failure kinds a pipeline stage can report
 */
enum class ErrorCode : uint8_t {
    RESOURCE_NOT_FOUND = 0,     // Logo file or output directory missing
    DECODE_ERROR,               // Raster file unreadable or corrupt
    ENCODING_ERROR,             // Data exceeds QR capacity or invalid encode request
    IO_WRITE_ERROR,             // Permission or filesystem failure on save
    VALIDATION_MISMATCH,        // Post-hoc decode does not match (advisory)
    INVALID_CONFIG              // Configuration value out of range
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::RESOURCE_NOT_FOUND: return "ResourceNotFound";
        case ErrorCode::DECODE_ERROR: return "DecodeError";
        case ErrorCode::ENCODING_ERROR: return "EncodingError";
        case ErrorCode::IO_WRITE_ERROR: return "IOWriteError";
        case ErrorCode::VALIDATION_MISMATCH: return "ValidationMismatch";
        case ErrorCode::INVALID_CONFIG: return "InvalidConfig";
        default: return "Unknown";
    }
}

struct Error {
    ErrorCode code = ErrorCode::ENCODING_ERROR;
    std::string message;

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

/**
 * @brief Value-or-error return type for pipeline stages
 *
 * Holds either a value of type T or an Error. Accessing the wrong
 * alternative throws std::logic_error.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!value_) throw std::logic_error("Result holds an error: " + error_.describe());
        return *value_;
    }

    const T& value() const {
        if (!value_) throw std::logic_error("Result holds an error: " + error_.describe());
        return *value_;
    }

    // Moves the value out; the Result is left empty-valued
    T take() {
        T out = std::move(value());
        value_.reset();
        return out;
    }

    const Error& error() const {
        if (value_) throw std::logic_error("Result holds a value");
        return error_;
    }

private:
    std::optional<T> value_;
    Error error_;
};

/**
 * @brief Success-or-error return type for operations without a value
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (!error_) throw std::logic_error("Status holds no error");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

}  // namespace kickqr
