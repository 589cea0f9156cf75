// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/fallback_generator.h>
#include <logging.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace callguard {

namespace {

const char* const HELP_GDPR =
    "GDPR assessment guidance\n"
    "\n"
    "1. Record a lawful basis for every processing activity and tell data subjects about it.\n"
    "2. Have a procedure for data subject requests that answers within one month.\n"
    "3. Run a data protection impact assessment before high-risk processing.\n"
    "4. Build data minimisation and privacy by default into new systems.\n"
    "5. Be able to notify the supervisory authority of a breach within 72 hours.\n"
    "\n"
    "This is general guidance. Confirm specifics with a qualified adviser.";

const char* const HELP_ISO27001 =
    "ISO 27001 assessment guidance\n"
    "\n"
    "1. Publish an information security policy with visible management commitment.\n"
    "2. Identify information security risks and choose a treatment for each.\n"
    "3. Keep an inventory of information assets and classify them.\n"
    "4. Manage user access and review access rights on a schedule.\n"
    "5. Define how incidents are reported, handled and learned from.\n"
    "\n"
    "This is general guidance. A full assessment needs an experienced auditor.";

const char* const HELP_GENERAL =
    "Compliance assessment guidance\n"
    "\n"
    "1. Keep records of compliance activities current and easy to find.\n"
    "2. Assess business risks regularly and apply proportionate controls.\n"
    "3. Train staff on the regulations that apply to them.\n"
    "4. Monitor controls and review them periodically.\n"
    "5. Prepare and rehearse an incident response plan.\n"
    "\n"
    "Requirements differ between regulations. Check the ones that apply to you.";

const char* const RECOMMENDATIONS_HIGH =
    "High priority recommendations\n"
    "\n"
    "Within 30 days: document current data processing, apply basic access controls,\n"
    "name incident contacts and brief employees.\n"
    "Within 3 months: complete a risk assessment, write the core policies, turn on\n"
    "monitoring and logging, and review key vendors.\n"
    "Within 6 months: finish staff training, add advanced security controls,\n"
    "schedule internal audits and plan for business continuity.";

const char* const RECOMMENDATIONS_MEDIUM =
    "Recommendations\n"
    "\n"
    "Strengthen: review existing policies, tighten monitoring and reporting,\n"
    "refresh staff training and improve record keeping.\n"
    "Optimise: automate routine compliance tasks, track key indicators and\n"
    "manage third parties more closely.";

const char* const ANALYSIS_MANUAL =
    "Automated analysis is not available for this request.\n"
    "\n"
    "To assess your position manually, list the regulations that apply, map each\n"
    "requirement to an owner and an existing control, and record any gaps with a\n"
    "target date. Re-run the automated analysis once the service is back.";

const char* const SERVICE_UNAVAILABLE =
    "The AI analysis service is temporarily unavailable.\n"
    "\n"
    "You can browse the compliance resource library, use the basic templates in\n"
    "your dashboard or contact support for manual help. Please try again shortly.";

} // namespace

FallbackGenerator::FallbackGenerator()
{
    templates_["help/gdpr"] = FallbackTemplate("help/gdpr", HELP_GDPR, 0.7);
    templates_["help/iso27001"] = FallbackTemplate("help/iso27001", HELP_ISO27001, 0.7);
    templates_["help/general"] = FallbackTemplate("help/general", HELP_GENERAL, 0.6);
    templates_["recommendations/high"] = FallbackTemplate("recommendations/high", RECOMMENDATIONS_HIGH, 0.6);
    templates_["recommendations/medium"] = FallbackTemplate("recommendations/medium", RECOMMENDATIONS_MEDIUM, 0.6);
    templates_["analysis"] = FallbackTemplate("analysis", ANALYSIS_MANUAL, 0.4);
    templates_["service_unavailable"] = FallbackTemplate("service_unavailable", SERVICE_UNAVAILABLE, 0.9);
}

const FallbackTemplate& FallbackGenerator::SelectTemplate(const std::string& taskType,
                                                          const RequestContext& context) const
{
    const std::string task = boost::algorithm::to_lower_copy(taskType);
    std::string key = "service_unavailable";

    if (task == "help") {
        const std::string framework = boost::algorithm::to_lower_copy(context.frameworkId);
        key = templates_.count("help/" + framework) ? "help/" + framework : "help/general";
    } else if (task == "recommendations") {
        const std::string risk = boost::algorithm::to_lower_copy(context.GetAttribute("risk_level"));
        key = risk == "high" ? "recommendations/high" : "recommendations/medium";
    } else if (task == "analysis") {
        key = "analysis";
    }

    return templates_.at(key);
}

FallbackContent FallbackGenerator::Generate(const std::string& taskType, const RequestContext& context,
                                            DegradeReason reason)
{
    const FallbackTemplate& tmpl = SelectTemplate(taskType, context);

    FallbackContent content;
    content.text = tmpl.text;
    content.confidence = tmpl.confidence;
    content.templateId = tmpl.id;

    {
        LOCK(cs_stats_);
        stats_.total++;
        stats_.byReason[reason]++;
        stats_.byTemplate[tmpl.id]++;
    }

    LogPrint(CGLog::FALLBACK, "Fallback for task %s: template %s (reason %s)\n",
             taskType, tmpl.id, DegradeReasonToString(reason));
    return content;
}

FallbackStats FallbackGenerator::GetStats() const
{
    LOCK(cs_stats_);
    return stats_;
}

} // namespace callguard
