/**
 * @file string_utils.hpp
 * @brief String and formatting helpers shared by checks and reporters
 *
 * Provides basic manipulation (trim, split, join, case folding), display
 * helpers (octal modes, truncation, sanitising untrusted text from the
 * image) and timestamp conversions used in findings and report headers.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace nsioc {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto mode = StringUtils::FormatOctalMode(0644);          // "0644"
 * auto shown = StringUtils::Truncate(long_signature, 40);  // "...." suffix
 * bool hit = StringUtils::ContainsIgnoreCase(line, "eval($_");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert ASCII letters to lowercase
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split by delimiter, dropping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split by any run of whitespace
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Join strings with a delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Case-insensitive substring test (ASCII folding)
     */
    static bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

    /***************************************************************************
     * Display Helpers
     ***************************************************************************/

    /**
     * @brief Replace non-printable characters with '.'
     *
     * Content read from a suspect image is untrusted; sanitise before logging.
     */
    static std::string Sanitize(const std::string& str);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum allowed length, suffix included
     * @param suffix Suffix to append if truncated (default: "...")
     *
     * **Example**:
     * @code
     * auto short_str = StringUtils::Truncate("very long string here", 10);
     * // short_str = "very lo..."
     * @endcode
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Format permission bits as a zero-padded octal string ("0644", "4755")
     */
    static std::string FormatOctalMode(std::uint32_t mode);

    /***************************************************************************
     * Timestamps
     ***************************************************************************/

    /**
     * @brief ISO 8601 UTC representation ("2023-07-18T09:12:44Z")
     */
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]" (UTC) or Unix seconds
     * @return std::nullopt for unrecognised input or dates the clock cannot hold
     */
    static std::optional<std::chrono::system_clock::time_point> ParseTimestamp(const std::string& text);

    /**
     * @brief Human-readable duration ("16 days 3 hours", "42 seconds")
     */
    static std::string FormatDuration(std::chrono::seconds duration);
};

} // namespace utils
} // namespace nsioc
