/**
 * @file finding.hpp
 * @brief Indicator of Compromise finding produced by the detection checks
 *
 * A Finding is the atomic output of every check: what kind of indicator was
 * observed, how confident the rule is, a human-readable message, and the
 * path inside the target where it was observed.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace nsioc {
namespace core {

/**
 * @enum FindingKind
 * @brief Categories of indicators reported by the checks
 */
enum class FindingKind {
    PHP_FILE_PERMISSION,   ///< Web file with a mode other than its baseline
    PHP_FILE_CONTENTS,     ///< Web file containing a known webshell signature
    TIMESTOMP,             ///< Internally inconsistent timestamps
    CRONJOB_SUSPICIOUS,    ///< Scheduled command matching a suspicious pattern
    CRONJOB_USER,          ///< Scheduled command running as an unexpected user
    BINARY_SUID            ///< Setuid binary missing from the allowlist
};

/**
 * @enum Confidence
 * @brief Rule-assigned confidence, ordered LOW < MEDIUM < HIGH
 */
enum class Confidence {
    LOW,      ///< Weak or borderline indicator
    MEDIUM,   ///< Likely related to compromise
    HIGH      ///< Strong indicator, investigate
};

/**
 * @class Finding
 * @brief Immutable record of one observed indicator
 *
 * **Example**:
 * @code
 * Finding finding(FindingKind::PHP_FILE_PERMISSION,
 *                 "Suspicious php permission 0644",
 *                 Confidence::HIGH,
 *                 "/var/vpn/config.php");
 * @endcode
 */
class Finding {
public:
    Finding(FindingKind kind, std::string message, Confidence confidence, std::string path)
        : kind_(kind)
        , message_(std::move(message))
        , confidence_(confidence)
        , path_(std::move(path)) {}

    FindingKind Kind() const { return kind_; }
    const std::string& Message() const { return message_; }
    Confidence GetConfidence() const { return confidence_; }
    const std::string& Path() const { return path_; }

    bool operator==(const Finding& other) const {
        return kind_ == other.kind_ && message_ == other.message_ &&
               confidence_ == other.confidence_ && path_ == other.path_;
    }
    bool operator!=(const Finding& other) const { return !(*this == other); }

private:
    FindingKind kind_;
    std::string message_;
    Confidence confidence_;
    std::string path_;
};

/**
 * @brief Wire name of a finding kind ("php-file-permission", "binary/suid", ...)
 */
std::string FindingKindToString(FindingKind kind);

/**
 * @brief Lower-case confidence name ("low", "medium", "high")
 */
std::string ConfidenceToString(Confidence confidence);

/**
 * @brief Parse a confidence name, case-insensitive
 * @return std::nullopt for unrecognised input
 */
std::optional<Confidence> ParseConfidence(const std::string& text);

/**
 * @brief Keep findings whose confidence is at least min_confidence, order preserved
 */
std::vector<Finding> FilterByConfidence(const std::vector<Finding>& findings,
                                        Confidence min_confidence);

} // namespace core
} // namespace nsioc
