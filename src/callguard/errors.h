// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_ERRORS_H
#define CALLGUARD_ERRORS_H

/**
 * @file errors.h
 * @brief Exception hierarchy for the resilience core
 *
 * ProviderError and its subclasses are the upstream failures a circuit
 * breaker counts. Anything else thrown from an upstream operation is a
 * programming or usage error and passes through the breaker uncounted.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace callguard {

class CallguardError : public std::runtime_error {
public:
    explicit CallguardError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Invalid or inconsistent configuration */
class ConfigError : public CallguardError {
public:
    explicit ConfigError(const std::string& msg) : CallguardError(msg) {}
};

/** Request the caller should never have sent (empty ids, unknown class) */
class InvalidRequestError : public CallguardError {
public:
    explicit InvalidRequestError(const std::string& msg) : CallguardError(msg) {}
};

// ============================================================================
// Upstream failures
// ============================================================================

class ProviderError : public CallguardError {
public:
    explicit ProviderError(const std::string& msg) : CallguardError(msg) {}
};

/** Upstream did not answer before the deadline */
class ProviderTimeoutError : public ProviderError {
public:
    explicit ProviderTimeoutError(const std::string& msg) : ProviderError(msg) {}
};

/** Upstream answered with an error or the transport failed */
class ProviderInvocationError : public ProviderError {
public:
    explicit ProviderInvocationError(const std::string& msg) : ProviderError(msg) {}
};

/** Transport aborted because its cancellation token fired */
class ProviderCancelledError : public ProviderError {
public:
    explicit ProviderCancelledError(const std::string& msg) : ProviderError(msg) {}
};

// ============================================================================
// Refusals
// ============================================================================

/** Raised instead of invoking an operation while the breaker is open */
class CircuitOpenError : public CallguardError {
public:
    CircuitOpenError(const std::string& provider, const std::string& model, int64_t retryAfterMs)
        : CallguardError("circuit open for " + provider + "/" + model)
        , provider_(provider)
        , model_(model)
        , retryAfterMs_(retryAfterMs)
    {}

    const std::string& GetProvider() const { return provider_; }
    const std::string& GetModel() const { return model_; }
    int64_t GetRetryAfterMillis() const { return retryAfterMs_; }

private:
    std::string provider_;
    std::string model_;
    int64_t retryAfterMs_;
};

class RateLimitExceededError : public CallguardError {
public:
    RateLimitExceededError(const std::string& subject, const std::string& operationClass, int64_t retryAfterMs)
        : CallguardError("rate limit exceeded for " + subject + " on " + operationClass)
        , subject_(subject)
        , operationClass_(operationClass)
        , retryAfterMs_(retryAfterMs)
    {}

    const std::string& GetSubject() const { return subject_; }
    const std::string& GetOperationClass() const { return operationClass_; }
    int64_t GetRetryAfterMillis() const { return retryAfterMs_; }

private:
    std::string subject_;
    std::string operationClass_;
    int64_t retryAfterMs_;
};

class BudgetExceededError : public CallguardError {
public:
    BudgetExceededError(const std::string& tenant, const std::string& reason)
        : CallguardError("budget exceeded for " + tenant + ": " + reason)
        , tenant_(tenant)
    {}

    const std::string& GetTenant() const { return tenant_; }

private:
    std::string tenant_;
};

} // namespace callguard

#endif // CALLGUARD_ERRORS_H
