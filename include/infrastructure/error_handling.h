#pragma once

#include <string>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace cryptotrade {

enum class ErrorCode {
    OK = 0,
    INSUFFICIENT_FUNDS,
    PRICE_UNAVAILABLE,
    OFFER_NOT_ACTIVE,
    INVALID_OPERATION,
    TOO_EARLY,
    INVARIANT_VIOLATION,
    STORAGE_UNAVAILABLE,
    NOT_FOUND,
    DATABASE_ERROR,
    INVALID_CONFIG,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;
    // Seconds until the request can succeed; set for TOO_EARLY.
    uint64_t retryAfter;
    
    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0), retryAfter(0) {}
    Error(ErrorCode c, const std::string& msg)
        : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0), retryAfter(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }
    
private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }
    
private:
    Error error_;
    bool hasValue_;
};

// Thrown by a failing leg inside a ledger transaction body. The transaction
// boundary catches it, rolls back and turns it back into a Result.
class ErrorException : public std::runtime_error {
public:
    explicit ErrorException(Error error);
    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }
    
private:
    Error error_;
};

// Process-wide tally of reported ledger errors, keyed by code.
class ErrorHandler {
public:
    static ErrorHandler& instance();
    
    void handle(const Error& error);
    
    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    Error getLastError() const;
    
private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorName(ErrorCode code);
bool isRetryable(ErrorCode code);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

// Records an invariant violation with the ErrorHandler at CRITICAL severity,
// logs it, and returns it ready to be thrown or returned.
Error reportInvariantViolation(const std::string& message, const std::string& context,
                               const char* file, int line);

#define CRYPTOTRADE_FAIL(code, msg) throw cryptotrade::ErrorException(cryptotrade::makeError(code, msg))
#define CRYPTOTRADE_INVARIANT(msg, ctx) \
    throw cryptotrade::ErrorException(cryptotrade::reportInvariantViolation(msg, ctx, __FILE__, __LINE__))

}
