/**
 * @file crontab_parser.cpp
 * @brief Implementation of crontab line parsing
 *
 * **Crontab Line Formats**:
 * ```
 * # user crontab (/var/cron/tabs/root)
 * 0 * * * *   /netscaler/nsaggregator -k
 * @reboot     /var/tmp/.x/agent
 *
 * # system crontab (/etc/crontab)
 * SHELL=/bin/sh
 * 1,31 * * * * root  /usr/libexec/atrun
 * ```
 *
 * @date 2025
 */

#include "nsioc/parsers/crontab_parser.hpp"
#include "nsioc/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace nsioc {
namespace parsers {

namespace {

constexpr std::size_t kScheduleFields = 5;

// Position just past the n-th whitespace separated field, or npos
std::size_t SkipFields(const std::string& line, std::size_t count, std::vector<std::string>& fields) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < count; ++i) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            pos++;
        }
        if (pos >= line.size()) {
            return std::string::npos;
        }
        auto start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            pos++;
        }
        fields.push_back(line.substr(start, pos - start));
    }
    return pos;
}

} // anonymous namespace

bool CrontabParser::IsEnvironmentLine(const std::string& line) {
    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    auto name = utils::StringUtils::Trim(line.substr(0, eq));
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

CrontabParseResult CrontabParser::Parse(const std::string& content, bool has_user_column) const {
    if (content.find('\0') != std::string::npos) {
        throw MalformedDefinitionError("crontab contains NUL bytes");
    }

    CrontabParseResult result;
    std::istringstream stream(content);
    std::string raw;
    int line_num = 0;

    while (std::getline(stream, raw)) {
        line_num++;
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }

        auto line = utils::StringUtils::Trim(raw);
        if (line.empty() || line[0] == '#' || IsEnvironmentLine(line)) {
            continue;
        }

        const std::size_t schedule_fields = line[0] == '@' ? 1 : kScheduleFields;
        const std::size_t leading = schedule_fields + (has_user_column ? 1 : 0);

        std::vector<std::string> fields;
        auto pos = SkipFields(line, leading, fields);
        auto command = pos == std::string::npos ? std::string() : utils::StringUtils::Trim(line.substr(pos));
        if (command.empty()) {
            spdlog::debug("Malformed crontab line {}: {}", line_num, line);
            result.malformed_lines.push_back(line_num);
            continue;
        }

        CrontabEntry entry;
        entry.line_number = line_num;
        entry.schedule = utils::StringUtils::Join(
            std::vector<std::string>(fields.begin(), fields.begin() + schedule_fields), " ");
        if (has_user_column) {
            entry.user = fields.back();
        }
        entry.command = command;
        result.entries.push_back(std::move(entry));
    }

    return result;
}

} // namespace parsers
} // namespace nsioc
