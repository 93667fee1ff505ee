/**
 * @file string_utils.hpp
 * @brief String manipulation utilities for code inspection and output handling
 *
 * Provides the small set of text helpers shared by the validator, the
 * configuration layer and the sandbox backends: trimming, splitting, case
 * folding, UTF-8 sanitization and bounded output truncation.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace codebox {
namespace utils {

/// Byte cap applied to captured stdout/stderr
constexpr std::size_t kMaxOutputBytes = 10 * 1024;

/// Marker appended to output cut off at kMaxOutputBytes
constexpr const char* kTruncationMarker = "\n... [output truncated]";

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto modules = StringUtils::SplitList("json, math ,numpy");
 * // modules = ["json", "math", "numpy"]
 *
 * std::string out = StringUtils::TruncateOutput(raw_stdout);
 * // out.size() <= kMaxOutputBytes + strlen(kTruncationMarker)
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Check whether a string is empty or whitespace only
     */
    static bool IsBlank(const std::string& str);

    /**
     * @brief Convert string to lowercase (ASCII)
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of substrings
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Parse a configuration list
     *
     * Accepts either a comma separated list (`"a, b,c"`) or a JSON array of
     * strings (`["a","b"]`). Items are trimmed and empty items dropped.
     *
     * @param value Raw configuration value
     * @return Parsed items in input order
     * @throws std::runtime_error if the value looks like a JSON array but
     *         does not parse as an array of strings
     */
    static std::vector<std::string> SplitList(const std::string& value);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Output Handling
     ***************************************************************************/

    /**
     * @brief Replace invalid UTF-8 sequences with U+FFFD
     *
     * Output captured from a container is an arbitrary byte stream; this
     * guarantees the text handed back to callers is valid UTF-8.
     *
     * @param str Raw bytes
     * @return Valid UTF-8 string
     */
    static std::string SanitizeUtf8(const std::string& str);

    /**
     * @brief Cap output at a byte limit and append the truncation marker
     *
     * The cut point backs off to a UTF-8 code point boundary. Text that
     * already ends with the marker and fits in `max_bytes` plus the marker
     * is returned unchanged, so applying this twice equals applying it once.
     *
     * @param str Output text
     * @param max_bytes Byte cap (default: kMaxOutputBytes)
     * @return Bounded text
     */
    static std::string TruncateOutput(const std::string& str,
                                      std::size_t max_bytes = kMaxOutputBytes);

    /**
     * @brief Shorten a string for log lines, appending "..." when cut
     */
    static std::string Abbreviate(const std::string& str, std::size_t max_length);
};

} // namespace utils
} // namespace codebox
