/**
 * @file finding.cpp
 * @brief Finding name conversions and confidence filtering
 *
 * @date 2025
 */

#include "nsioc/core/finding.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace nsioc {
namespace core {

std::string FindingKindToString(FindingKind kind) {
    switch (kind) {
        case FindingKind::PHP_FILE_PERMISSION: return "php-file-permission";
        case FindingKind::PHP_FILE_CONTENTS:   return "php-file-contents";
        case FindingKind::TIMESTOMP:           return "timestomp";
        case FindingKind::CRONJOB_SUSPICIOUS:  return "cronjob/suspicious";
        case FindingKind::CRONJOB_USER:        return "cronjob/user";
        case FindingKind::BINARY_SUID:         return "binary/suid";
        default: return "unknown";
    }
}

std::string ConfidenceToString(Confidence confidence) {
    switch (confidence) {
        case Confidence::LOW:    return "low";
        case Confidence::MEDIUM: return "medium";
        case Confidence::HIGH:   return "high";
        default: return "unknown";
    }
}

std::optional<Confidence> ParseConfidence(const std::string& text) {
    auto lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(text));
    if (lowered == "low") return Confidence::LOW;
    if (lowered == "medium") return Confidence::MEDIUM;
    if (lowered == "high") return Confidence::HIGH;
    return std::nullopt;
}

std::vector<Finding> FilterByConfidence(const std::vector<Finding>& findings,
                                        Confidence min_confidence) {
    std::vector<Finding> filtered;
    std::copy_if(findings.begin(), findings.end(), std::back_inserter(filtered),
                 [min_confidence](const Finding& finding) {
                     return finding.GetConfidence() >= min_confidence;
                 });
    return filtered;
}

} // namespace core
} // namespace nsioc
