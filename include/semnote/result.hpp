#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace semnote {

// Error codes for the embedding store and search engine
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    IO_ERROR,
    INTERNAL_ERROR,
    // Validation errors: rejected before any store mutation
    INVALID_ARGUMENT,
    NOT_A_NOTE,
    CONFIRMATION_REQUIRED,
    // Embedding provider errors
    EMBEDDING_FAILED,
    EMBEDDING_DIMENSION_MISMATCH,
    MALFORMED_RESPONSE,
    NETWORK_ERROR,
    TIMEOUT,
    PROVIDER_UNAVAILABLE,
    // Store errors: the transaction is rolled back in full
    STORE_NOT_OPEN,
    SCHEMA_ERROR,
    TRANSACTION_ABORTED,
    CORRUPTION,
    DIMENSION_MISMATCH
};

enum class ErrorCategory {
    NONE,
    GENERAL,
    VALIDATION,
    EMBEDDING,
    STORE
};

// Error with code, message and an optional underlying cause
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}
    Error(ErrorCode code, std::string message, const Error& cause)
        : code_(code), message_(std::move(message)),
          cause_(std::make_shared<const Error>(cause)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    // The error this one was raised from, or nullptr.
    const Error* cause() const { return cause_.get(); }

    ErrorCategory category() const { return category_of(code_); }
    bool is_validation_error() const { return category() == ErrorCategory::VALIDATION; }
    bool is_embedding_error() const { return category() == ErrorCategory::EMBEDDING; }
    bool is_store_error() const { return category() == ErrorCategory::STORE; }

    std::string to_string() const {
        std::string out = error_code_name(code_);
        if (!message_.empty()) {
            out += ": " + message_;
        }
        if (cause_) {
            out += " (caused by " + cause_->to_string() + ")";
        }
        return out;
    }

    static ErrorCategory category_of(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK:
                return ErrorCategory::NONE;
            case ErrorCode::INVALID_ARGUMENT:
            case ErrorCode::NOT_A_NOTE:
            case ErrorCode::CONFIRMATION_REQUIRED:
                return ErrorCategory::VALIDATION;
            case ErrorCode::EMBEDDING_FAILED:
            case ErrorCode::EMBEDDING_DIMENSION_MISMATCH:
            case ErrorCode::MALFORMED_RESPONSE:
            case ErrorCode::NETWORK_ERROR:
            case ErrorCode::TIMEOUT:
            case ErrorCode::PROVIDER_UNAVAILABLE:
                return ErrorCategory::EMBEDDING;
            case ErrorCode::STORE_NOT_OPEN:
            case ErrorCode::SCHEMA_ERROR:
            case ErrorCode::TRANSACTION_ABORTED:
            case ErrorCode::CORRUPTION:
            case ErrorCode::DIMENSION_MISMATCH:
                return ErrorCategory::STORE;
            default:
                return ErrorCategory::GENERAL;
        }
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::NOT_A_NOTE: return "NOT_A_NOTE";
            case ErrorCode::CONFIRMATION_REQUIRED: return "CONFIRMATION_REQUIRED";
            case ErrorCode::EMBEDDING_FAILED: return "EMBEDDING_FAILED";
            case ErrorCode::EMBEDDING_DIMENSION_MISMATCH: return "EMBEDDING_DIMENSION_MISMATCH";
            case ErrorCode::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
            case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
            case ErrorCode::TIMEOUT: return "TIMEOUT";
            case ErrorCode::PROVIDER_UNAVAILABLE: return "PROVIDER_UNAVAILABLE";
            case ErrorCode::STORE_NOT_OPEN: return "STORE_NOT_OPEN";
            case ErrorCode::SCHEMA_ERROR: return "SCHEMA_ERROR";
            case ErrorCode::TRANSACTION_ABORTED: return "TRANSACTION_ABORTED";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::DIMENSION_MISMATCH: return "DIMENSION_MISMATCH";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
    std::shared_ptr<const Error> cause_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

}  // namespace semnote
