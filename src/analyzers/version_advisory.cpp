/**
 * @file version_advisory.cpp
 * @brief Implementation of the NetScaler version advisory table
 *
 * @date 2025
 */

#include "nsioc/analyzers/version_advisory.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace nsioc {
namespace analyzers {

namespace {

struct CveCheck {
    const char* cve;
    const char* bulletin;
    bool (*affected)(const VersionTuple&);
};

const CveCheck kCveChecks[] = {
    {"CVE-2025-5349", "CTX693420", &VersionAdvisory::IsVulnerableCtx693420},
    {"CVE-2025-5777", "CTX693420", &VersionAdvisory::IsVulnerableCtx693420},
    {"CVE-2025-6543", "CTX694788", &VersionAdvisory::IsVulnerableCtx694788},
    {"CVE-2025-7775", "CTX694938", &VersionAdvisory::IsVulnerableCtx694938},
    {"CVE-2025-7776", "CTX694938", &VersionAdvisory::IsVulnerableCtx694938},
    {"CVE-2025-8424", "CTX694938", &VersionAdvisory::IsVulnerableCtx694938},
};

bool ParseNumber(const std::string& text, int& value) {
    if (text.empty() || text.size() > 6 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    value = std::stoi(text);
    return true;
}

} // anonymous namespace

std::optional<VersionTuple> ParseVersion(const std::string& version) {
    auto text = utils::StringUtils::Trim(version);
    if (text.empty() || text == "unknown") {
        return std::nullopt;
    }

    std::replace(text.begin(), text.end(), '.', '-');
    auto parts = utils::StringUtils::Split(text, '-');
    if (parts.size() != 4) {
        return std::nullopt;
    }

    VersionTuple tuple;
    if (!ParseNumber(parts[0], tuple.major) || !ParseNumber(parts[1], tuple.minor) ||
        !ParseNumber(parts[2], tuple.build) || !ParseNumber(parts[3], tuple.patch)) {
        return std::nullopt;
    }
    return tuple;
}

bool VersionAdvisory::IsFips121(const VersionTuple& version) {
    return version.major == 12 && version.minor == 1 && version.build == 55;
}

bool VersionAdvisory::IsFips131(const VersionTuple& version) {
    return version.major == 13 && version.minor == 1 && version.build == 37;
}

bool VersionAdvisory::IsEol(const VersionTuple& version) {
    if (IsFips131(version) || IsFips121(version)) {
        return false;
    }
    if (version.major == 13 && version.minor == 0) {
        return true;
    }
    return version.major <= 12;
}

bool VersionAdvisory::IsVulnerableCtx693420(const VersionTuple& version) {
    if (IsFips131(version)) {
        return version < VersionTuple{13, 1, 37, 235};
    }
    if (IsFips121(version)) {
        return version < VersionTuple{12, 1, 55, 328};
    }
    if (version.major == 14) {
        return version < VersionTuple{14, 1, 43, 56};
    }
    if (version.major == 13) {
        return version < VersionTuple{13, 1, 58, 32};
    }
    return IsEol(version);
}

bool VersionAdvisory::IsVulnerableCtx694788(const VersionTuple& version) {
    if (IsFips131(version)) {
        return version < VersionTuple{13, 1, 37, 236};
    }
    // 12.1-FIPS is not affected
    if (IsFips121(version)) {
        return false;
    }
    if (version.major == 14) {
        return version < VersionTuple{14, 1, 47, 46};
    }
    if (version.major == 13) {
        return version < VersionTuple{13, 1, 59, 19};
    }
    return IsEol(version);
}

bool VersionAdvisory::IsVulnerableCtx694938(const VersionTuple& version) {
    if (IsFips131(version)) {
        return version < VersionTuple{13, 1, 37, 241};
    }
    if (IsFips121(version)) {
        return version < VersionTuple{12, 1, 55, 330};
    }
    if (version.major == 14) {
        return version < VersionTuple{14, 1, 47, 48};
    }
    if (version.major == 13) {
        return version < VersionTuple{13, 1, 59, 22};
    }
    return IsEol(version);
}

AdvisoryResult VersionAdvisory::Evaluate(const std::string& version) const {
    AdvisoryResult result;
    result.version = version;

    auto tuple = ParseVersion(version);
    if (!tuple) {
        spdlog::debug("No advisory for unparsable version '{}'", version);
        return result;
    }

    result.parsed = true;
    result.fips = IsFips121(*tuple) || IsFips131(*tuple);
    result.end_of_life = IsEol(*tuple);

    for (const auto& check : kCveChecks) {
        if (check.affected(*tuple)) {
            result.vulnerable.push_back({check.cve, check.bulletin});
        }
    }

    spdlog::debug("Version {} affected by {} CVE(s)", version, result.vulnerable.size());
    return result;
}

} // namespace analyzers
} // namespace nsioc
