#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <mutex>
#include <unordered_map>
#include <ctime>

namespace cryptotrade {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INSUFFICIENT_FUNDS: return "Insufficient funds";
        case ErrorCode::PRICE_UNAVAILABLE: return "Price unavailable";
        case ErrorCode::OFFER_NOT_ACTIVE: return "Offer not active";
        case ErrorCode::INVALID_OPERATION: return "Invalid operation";
        case ErrorCode::TOO_EARLY: return "Too early";
        case ErrorCode::INVARIANT_VIOLATION: return "Invariant violation";
        case ErrorCode::STORAGE_UNAVAILABLE: return "Storage unavailable";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
        default: return "Unknown error";
    }
}

const char* errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Ok";
        case ErrorCode::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case ErrorCode::PRICE_UNAVAILABLE: return "PriceUnavailable";
        case ErrorCode::OFFER_NOT_ACTIVE: return "OfferNotActive";
        case ErrorCode::INVALID_OPERATION: return "InvalidOperation";
        case ErrorCode::TOO_EARLY: return "TooEarly";
        case ErrorCode::INVARIANT_VIOLATION: return "InvariantViolation";
        case ErrorCode::STORAGE_UNAVAILABLE: return "StorageUnavailable";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::DATABASE_ERROR: return "DatabaseError";
        case ErrorCode::INVALID_CONFIG: return "InvalidConfig";
        default: return "Unknown";
    }
}

bool isRetryable(ErrorCode code) {
    return code == ErrorCode::STORAGE_UNAVAILABLE;
}

ErrorException::ErrorException(Error error)
    : std::runtime_error(error.message.empty() ? errorToString(error.code) : error.message),
      error_(std::move(error)) {}

void throwIfError(const Error& error) {
    if (error.code != ErrorCode::OK) {
        throw ErrorException(error);
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

Error reportInvariantViolation(const std::string& message, const std::string& context,
                               const char* file, int line) {
    Error err = makeError(ErrorCode::INVARIANT_VIOLATION, message, context);
    err.severity = ErrorSeverity::CRITICAL;
    err.file = file;
    err.line = line;
    utils::Logger::log(utils::LogLevel::ERROR, "ledger",
                       "INVARIANT VIOLATION: " + message + " [" + context + "] (" +
                       std::string(file) + ":" + std::to_string(line) + ")");
    ErrorHandler::instance().handle(err);
    return err;
}

struct ErrorHandler::Impl {
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    Error lastError;
    mutable std::mutex mtx;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::handle(const Error& error) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->lastError = error;
    if (impl_->lastError.timestamp == 0) {
        impl_->lastError.timestamp = static_cast<uint64_t>(std::time(nullptr));
    }
    impl_->totalErrors++;
    impl_->errorCounts[static_cast<int>(error.code)]++;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

}
