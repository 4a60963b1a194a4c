/**
 * @file version_advisory.hpp
 * @brief Offline vulnerability advisory for the firmware version found in an image
 *
 * Maps a NetScaler version string ("13.1-49.15") to the published security
 * bulletins it is affected by. The advisory only adds context to the report
 * header; vulnerability is not compromise, so it never produces findings.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <tuple>

namespace nsioc {
namespace analyzers {

/**
 * @struct VersionTuple
 * @brief Numeric NetScaler release, "13.1-49.15" => {13, 1, 49, 15}
 */
struct VersionTuple {
    int major{0};
    int minor{0};
    int build{0};
    int patch{0};

    bool operator<(const VersionTuple& other) const {
        return std::tie(major, minor, build, patch) <
               std::tie(other.major, other.minor, other.build, other.patch);
    }
    bool operator==(const VersionTuple& other) const {
        return std::tie(major, minor, build, patch) ==
               std::tie(other.major, other.minor, other.build, other.patch);
    }
};

/**
 * @struct CveAdvisory
 * @brief One CVE the version is affected by
 */
struct CveAdvisory {
    std::string cve;            ///< "CVE-2025-5777"
    std::string bulletin;       ///< "CTX693420"
};

/**
 * @struct AdvisoryResult
 * @brief Advisory outcome for one version string
 */
struct AdvisoryResult {
    std::string version;                    ///< Input as given
    bool parsed{false};                     ///< False for "unknown" or garbage
    bool fips{false};                       ///< FIPS / NDcPP release line
    bool end_of_life{false};                ///< 12.1 and 13.0 (non-FIPS) and older
    std::vector<CveAdvisory> vulnerable;    ///< Affected CVEs in bulletin order
};

/**
 * @brief Parse "13.1-49.15" (or "13.1-37-241")
 * @return std::nullopt if the string is not a four-part version
 */
std::optional<VersionTuple> ParseVersion(const std::string& version);

/**
 * @class VersionAdvisory
 * @brief Fixed table of NetScaler security bulletins
 *
 * | Bulletin  | CVEs                                  | Fixed in                                |
 * |-----------|---------------------------------------|-----------------------------------------|
 * | CTX693420 | CVE-2025-5349, CVE-2025-5777          | 14.1-43.56, 13.1-58.32, 13.1-37.235 FIPS, 12.1-55.328 FIPS |
 * | CTX694788 | CVE-2025-6543                         | 14.1-47.46, 13.1-59.19, 13.1-37.236 FIPS |
 * | CTX694938 | CVE-2025-7775, CVE-2025-7776, CVE-2025-8424 | 14.1-47.48, 13.1-59.22, 13.1-37.241 FIPS, 12.1-55.330 FIPS |
 *
 * End-of-life releases are treated as affected by every bulletin.
 */
class VersionAdvisory {
public:
    AdvisoryResult Evaluate(const std::string& version) const;

    static bool IsFips121(const VersionTuple& version);
    static bool IsFips131(const VersionTuple& version);
    static bool IsEol(const VersionTuple& version);

    static bool IsVulnerableCtx693420(const VersionTuple& version);
    static bool IsVulnerableCtx694788(const VersionTuple& version);
    static bool IsVulnerableCtx694938(const VersionTuple& version);
};

} // namespace analyzers
} // namespace nsioc
