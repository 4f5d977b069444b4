#pragma once

#include <string>
#include <variant>
#include <crow.h>

namespace arbundle {

// Error categories for classification and HTTP status mapping
enum class ErrorCategory {
    Validation,       // Malformed identifier, path, URL or payload
    PayloadTooLarge,  // Size limits exceeded
    SecurityPolicy,   // Traversal, disallowed domain, private address
    Upstream,         // Remote server answered with a failure
    Timeout,          // Remote fetch exceeded its time bound
    Storage,          // Disk write or archive build failure
    NotFound,         // Resource not found
    Internal          // Internal/programming errors
};

// Error details structure.
// `message` is safe to show to clients, `details` is for the server log only.
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;
    int http_status_code;

    // Factory methods for common error types
    static Error Validation(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Validation, msg, details, 400};
    }

    static Error TooLarge(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::PayloadTooLarge, msg, details, 413};
    }

    static Error Security(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::SecurityPolicy, msg, details, 403};
    }

    static Error Upstream(int status, const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Upstream, msg, details, status};
    }

    static Error Timeout(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Timeout, msg, details, 408};
    }

    static Error Storage(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Storage, msg, details, 500};
    }

    static Error NotFound(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::NotFound, msg, details, 404};
    }

    static Error Internal(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Internal, msg, details, 500};
    }

    // Convert error to HTTP response (never includes details)
    crow::response toHttpResponse() const;

    // Convert error to JSON representation (never includes details)
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;

    bool isSecurityViolation() const { return category == ErrorCategory::SecurityPolicy; }

    // Write the error to the server log, including details.
    // Security violations are tagged for audit.
    void log(const std::string& context) const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
// This is the Result type pattern for operations that can fail
template<typename T, typename E = Error>
class Expected {
public:
    // Constructor for value types (T && lvalue ref, excluding E type and Expected itself)
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    // Constructor for error types (E && references)
    // Only enabled when U decays to E
    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    // Copy constructor deleted
    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    // Move constructor
    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    // Move assignment
    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // Destructor
    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    // Check if contains value (success)
    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    // Get the value (only valid if has_value() is true)
    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    // Get the error (only valid if has_value() is false)
    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    // Dereference operators for convenience
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Alias for common Result type: Result<T> means Result<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace arbundle
