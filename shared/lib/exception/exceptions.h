/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types across the certificate management
 * service. Validation, precondition and policy failures carry the field
 * they refer to so that callers can report them per input attribute.
 *
 * @date 2026-02-04
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace common {

/**
 * @brief Base exception for all certificate management exceptions
 */
class CertMgrException : public std::runtime_error {
public:
    explicit CertMgrException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public CertMgrException {
public:
    explicit DatabaseException(const std::string& message)
        : CertMgrException("Database error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public CertMgrException {
public:
    explicit ConfigException(const std::string& message)
        : CertMgrException("Configuration error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public CertMgrException {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : CertMgrException(poolType + " connection pool exhausted") {}
};

// ---------------------------------------------------------------------------
// Field-addressable failures
// ---------------------------------------------------------------------------

/**
 * @brief One failed attribute, e.g. {"certificate_create.name", "..."}
 */
struct FieldError {
    std::string field;
    std::string message;
};

/**
 * @brief Collector for validation failures
 *
 * Workflows add every failure they find and raise them together with
 * throwIfAny(), so a caller sees the whole batch at once.
 */
class ValidationErrors {
public:
    void add(const std::string& field, const std::string& message) {
        errors_.push_back({field, message});
    }

    void extend(const ValidationErrors& other) {
        errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
    }

    bool empty() const { return errors_.empty(); }
    size_t size() const { return errors_.size(); }

    /// True if at least one error was recorded for @p field
    bool contains(const std::string& field) const {
        for (const auto& e : errors_) {
            if (e.field == field) return true;
        }
        return false;
    }

    const std::vector<FieldError>& errors() const { return errors_; }

    /// @throws ValidationException if any error was recorded
    void throwIfAny() const;

private:
    std::vector<FieldError> errors_;
};

/**
 * @brief Batched, field-tagged validation failure
 */
class ValidationException : public CertMgrException {
public:
    explicit ValidationException(ValidationErrors errors)
        : CertMgrException(format(errors)), errors_(std::move(errors)) {}

    ValidationException(const std::string& field, const std::string& message)
        : ValidationException(single(field, message)) {}

    const std::vector<FieldError>& errors() const { return errors_.errors(); }

    bool contains(const std::string& field) const { return errors_.contains(field); }

private:
    static ValidationErrors single(const std::string& field, const std::string& message) {
        ValidationErrors errors;
        errors.add(field, message);
        return errors;
    }

    static std::string format(const ValidationErrors& errors) {
        std::string msg = "Validation error:";
        for (const auto& e : errors.errors()) {
            msg += " [" + e.field + "] " + e.message + ";";
        }
        return msg;
    }

    ValidationErrors errors_;
};

inline void ValidationErrors::throwIfAny() const {
    if (!errors_.empty()) {
        throw ValidationException(*this);
    }
}

/**
 * @brief Referenced record is missing or lacks required material
 */
class PreconditionException : public CertMgrException {
public:
    PreconditionException(const std::string& field, const std::string& message)
        : CertMgrException("Precondition failed: [" + field + "] " + message),
          field_(field), detail_(message) {}

    const std::string& field() const { return field_; }
    const std::string& detail() const { return detail_; }

private:
    std::string field_;
    std::string detail_;
};

/**
 * @brief Operation is forbidden by system policy
 */
class PolicyException : public CertMgrException {
public:
    PolicyException(const std::string& field, const std::string& message)
        : CertMgrException("Policy violation: [" + field + "] " + message),
          field_(field), detail_(message) {}

    const std::string& field() const { return field_; }
    const std::string& detail() const { return detail_; }

private:
    std::string field_;
    std::string detail_;
};

/**
 * @brief ACME or DNS collaborator reported a failure
 */
class ProtocolException : public CertMgrException {
public:
    explicit ProtocolException(const std::string& message)
        : CertMgrException(message) {}
};

/**
 * @brief Bounded wait elapsed
 */
class TimeoutException : public CertMgrException {
public:
    explicit TimeoutException(const std::string& message)
        : CertMgrException(message) {}
};

} // namespace common
