// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_FINGERPRINT_H
#define CALLGUARD_FINGERPRINT_H

/**
 * @file fingerprint.h
 * @brief Request fingerprints used as cache keys
 *
 * A fingerprint is the SHA-256 of the normalized prompt, the task type and
 * the semantic context fields (business profile and framework). Request
 * ids, timestamps and any other per-request attributes are excluded so that
 * semantically identical requests share one cache entry.
 */

#include <map>
#include <string>
#include <vector>

namespace callguard {

/** Hex characters of a fingerprint carried in events and logs */
static constexpr size_t FINGERPRINT_PREFIX_LENGTH = 12;

/**
 * @brief Context accompanying a generation request
 */
struct RequestContext {
    std::string businessProfileId;
    std::string frameworkId;
    /** Free-form attributes (risk level, request id, ...). Not fingerprinted. */
    std::map<std::string, std::string> attributes;

    std::string GetAttribute(const std::string& key) const;
};

/** Trim, collapse whitespace runs to a single space, lowercase ASCII */
std::string NormalizePrompt(const std::string& prompt);

/** Lowercase hex SHA-256 over the fingerprinted fields */
std::string ComputeFingerprint(const std::string& prompt, const std::string& taskType,
                               const RequestContext& context);

/**
 * Cache key for a fallback served when every candidate was exhausted.
 * Whether a request exhausts its providers depends on the tenant and on
 * the candidate set it resolved to, so both are hashed in with the request
 * fingerprint. Candidate keys are taken in the order they were tried.
 */
std::string ComputeFallbackKey(const std::string& fingerprint, const std::string& tenantId,
                               const std::vector<std::string>& candidateKeys);

/** Leading characters of a fingerprint, safe to log */
std::string FingerprintPrefix(const std::string& fingerprint);

} // namespace callguard

#endif // CALLGUARD_FINGERPRINT_H
