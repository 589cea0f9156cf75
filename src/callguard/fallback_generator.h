// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_FALLBACK_GENERATOR_H
#define CALLGUARD_FALLBACK_GENERATOR_H

/**
 * @file fallback_generator.h
 * @brief Degraded-but-useful content when no live call succeeds
 *
 * Content comes from static templates chosen by task type and context:
 *
 * - "help": guidance for the request's framework (gdpr, iso27001, general)
 * - "recommendations": action plan by the "risk_level" attribute (high, medium)
 * - "analysis": manual self-assessment checklist
 * - anything else: a generic service-unavailable notice
 *
 * Generation never fails and never returns empty text.
 */

#include <callguard/callguard_common.h>
#include <callguard/fingerprint.h>
#include <sync.h>

#include <cstdint>
#include <map>
#include <string>

namespace callguard {

struct FallbackTemplate {
    std::string id;
    std::string text;
    /** How useful the content is expected to be, 0..1 */
    double confidence;

    FallbackTemplate() : confidence(0) {}
    FallbackTemplate(const std::string& templateId, const std::string& body, double conf)
        : id(templateId), text(body), confidence(conf) {}
};

struct FallbackContent {
    std::string text;
    double confidence;
    /** Template the text was built from */
    std::string templateId;

    FallbackContent() : confidence(0) {}
};

struct FallbackStats {
    uint64_t total;
    std::map<DegradeReason, uint64_t> byReason;
    std::map<std::string, uint64_t> byTemplate;

    FallbackStats() : total(0) {}
};

/**
 * @brief Template-based fallback generator
 *
 * Thread-safe; templates are immutable after construction.
 */
class FallbackGenerator {
public:
    FallbackGenerator();

    /**
     * @brief Produce fallback content
     * @param taskType Task type of the request
     * @param context Request context (framework id, risk_level attribute)
     * @param reason Why the live path was not used
     */
    FallbackContent Generate(const std::string& taskType, const RequestContext& context, DegradeReason reason);

    /** Template chosen for a task type and context */
    const FallbackTemplate& SelectTemplate(const std::string& taskType, const RequestContext& context) const;

    FallbackStats GetStats() const;

private:
    std::map<std::string, FallbackTemplate> templates_;

    mutable CCriticalSection cs_stats_;
    FallbackStats stats_;
};

} // namespace callguard

#endif // CALLGUARD_FALLBACK_GENERATOR_H
