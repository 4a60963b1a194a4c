/**
 * @file host_fingerprint.hpp
 * @brief Identification of the appliance behind a target filesystem
 *
 * Collects report-header context: operating system family, hostname,
 * firmware version, installation time and last log activity. Every value is
 * optional; nothing here influences which findings the checks produce
 * except the install time consumed by the timestomp check.
 *
 * @date 2025
 */

#pragma once

#include "nsioc/analyzers/version_advisory.hpp"
#include "nsioc/config/ioc_rules.hpp"
#include "nsioc/fs/filesystem_view.hpp"

#include <string>
#include <optional>

namespace nsioc {
namespace analyzers {

/**
 * @struct TargetInfo
 * @brief What is known about the appliance a target was acquired from
 */
struct TargetInfo {
    std::string name;                               ///< Target label (root directory as given)
    std::string os{"unknown"};                      ///< "citrix-netscaler" or "unknown"
    std::optional<std::string> hostname;            ///< From `set ns hostName`
    std::optional<std::string> version;             ///< "13.1-49.15"
    std::optional<fs::Timestamp> install_time;      ///< Detected or supplied on the command line
    std::optional<fs::Timestamp> last_activity;     ///< Latest log modification
    AdvisoryResult advisory;                        ///< Only meaningful when version is set
};

/**
 * @class HostFingerprint
 * @brief Derives TargetInfo from well-known NetScaler locations
 *
 * **Sources**:
 * - OS: any of rules.os_markers exists (/netscaler, /flash/nsconfig)
 * - Hostname, version: first readable rules.config_files entry (ns.conf),
 *   `set ns hostName <name>` and the `#NS13.1 Build 49.15` header line
 * - Install time: earliest birth (else change) time of rules.install_markers
 * - Last activity: latest modification time of rules.activity_logs
 */
class HostFingerprint {
public:
    explicit HostFingerprint(const config::FingerprintRules& rules);

    /**
     * @brief Fingerprint a target
     * @param view Target filesystem
     * @param name Label stored in TargetInfo::name
     */
    TargetInfo Collect(const fs::FileSystemView& view, const std::string& name) const;

    /**
     * @brief Extract "13.1-49.15" from a "#NS13.1 Build 49.15" header line
     */
    static std::optional<std::string> ParseVersionHeader(const std::string& line);

    /**
     * @brief Extract the name from a "set ns hostName <name>" line
     */
    static std::optional<std::string> ParseHostnameLine(const std::string& line);

private:
    void ReadConfig(const fs::FileSystemView& view, TargetInfo& info) const;

    config::FingerprintRules rules_;
    VersionAdvisory advisory_;
};

} // namespace analyzers
} // namespace nsioc
