/**
 * @file crontab_parser.hpp
 * @brief Parser for cron definition files (user crontabs and system crontabs)
 *
 * Extracts the schedule, optional user and command of every job line so the
 * cronjob check can inspect commands. Used by CheckCronjobs.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace nsioc {
namespace parsers {

/**
 * @class MalformedDefinitionError
 * @brief Content is not a text crontab at all (binary data, NUL bytes)
 */
class MalformedDefinitionError : public std::runtime_error {
public:
    explicit MalformedDefinitionError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct CrontabEntry
 * @brief One scheduled job
 */
struct CrontabEntry {
    int line_number{0};         ///< 1-based line in the definition file
    std::string schedule;       ///< "*/5 * * * *" or "@reboot"
    std::string user;           ///< Empty for user crontabs
    std::string command;        ///< Remainder of the line, original spacing kept
};

/**
 * @struct CrontabParseResult
 * @brief Jobs of a definition file plus the lines that could not be parsed
 */
struct CrontabParseResult {
    std::vector<CrontabEntry> entries;
    std::vector<int> malformed_lines;   ///< Lines with too few fields
};

/**
 * @class CrontabParser
 * @brief Line-oriented crontab parser
 *
 * Comments, blank lines and `NAME=value` environment assignments are
 * skipped. `@reboot`, `@daily` and the other specials take a single schedule
 * field; all other lines take five. System crontabs (`/etc/crontab`,
 * `/etc/cron.d/`) carry a user field between schedule and command.
 *
 * **Usage Example**:
 * @code
 * CrontabParser parser;
 * auto parsed = parser.Parse(content, true);
 * for (const auto& entry : parsed.entries) {
 *     std::cout << entry.user << ": " << entry.command << std::endl;
 * }
 * @endcode
 */
class CrontabParser {
public:
    /**
     * @brief Parse crontab content
     * @param content File content
     * @param has_user_column True for system crontabs
     * @throws MalformedDefinitionError if content contains NUL bytes
     */
    CrontabParseResult Parse(const std::string& content, bool has_user_column) const;

private:
    static bool IsEnvironmentLine(const std::string& line);
};

} // namespace parsers
} // namespace nsioc
