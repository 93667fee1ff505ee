/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 *
 * Implements trimming, list parsing, UTF-8 sanitization and output
 * truncation. Truncation operates on bytes but never splits a multi-byte
 * UTF-8 sequence.
 *
 * @date 2025
 */

#include "codebox/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace codebox {
namespace utils {

namespace {

// Length of a UTF-8 sequence given its lead byte, 0 if the byte cannot lead
std::size_t Utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Validates the sequence starting at pos, including overlong and surrogate checks
bool IsValidSequence(const std::string& str, std::size_t pos, std::size_t length) {
    if (pos + length > str.size()) {
        return false;
    }
    const auto lead = static_cast<unsigned char>(str[pos]);
    for (std::size_t i = 1; i < length; ++i) {
        if (!IsContinuation(static_cast<unsigned char>(str[pos + i]))) {
            return false;
        }
    }
    if (length == 3) {
        const auto second = static_cast<unsigned char>(str[pos + 1]);
        if (lead == 0xE0 && second < 0xA0) return false;   // overlong
        if (lead == 0xED && second > 0x9F) return false;   // surrogates
    }
    if (length == 4) {
        const auto second = static_cast<unsigned char>(str[pos + 1]);
        if (lead == 0xF0 && second < 0x90) return false;   // overlong
        if (lead == 0xF4 && second > 0x8F) return false;   // > U+10FFFF
    }
    return true;
}

constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool StringUtils::IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitList(const std::string& value) {
    std::vector<std::string> items;
    const std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        return items;
    }

    if (trimmed.front() == '[') {
        auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array()) {
            throw std::runtime_error("Malformed JSON list: " + Abbreviate(trimmed, 64));
        }
        for (const auto& item : parsed) {
            if (!item.is_string()) {
                throw std::runtime_error("JSON list items must be strings");
            }
            auto entry = Trim(item.get<std::string>());
            if (!entry.empty()) {
                items.push_back(entry);
            }
        }
        return items;
    }

    for (const auto& part : Split(trimmed, ',')) {
        auto entry = Trim(part);
        if (!entry.empty()) {
            items.push_back(entry);
        }
    }
    return items;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// OUTPUT SANITIZATION AND TRUNCATION
// ============================================================================

std::string StringUtils::SanitizeUtf8(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    std::size_t pos = 0;
    while (pos < str.size()) {
        const auto lead = static_cast<unsigned char>(str[pos]);
        const std::size_t length = Utf8SequenceLength(lead);
        if (length != 0 && IsValidSequence(str, pos, length)) {
            result.append(str, pos, length);
            pos += length;
            continue;
        }
        result += kReplacementCharacter;
        ++pos;
        // Skip stray continuation bytes belonging to the same broken sequence
        while (pos < str.size() && IsContinuation(static_cast<unsigned char>(str[pos])) &&
               length != 0) {
            ++pos;
        }
    }

    return result;
}

std::string StringUtils::TruncateOutput(const std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }

    const std::size_t marker_length = std::strlen(kTruncationMarker);
    if (str.size() <= max_bytes + marker_length && EndsWith(str, kTruncationMarker)) {
        return str;  // Already truncated
    }

    std::size_t cut = max_bytes;
    while (cut > 0 && IsContinuation(static_cast<unsigned char>(str[cut]))) {
        --cut;
    }

    spdlog::debug("Truncating output from {} to {} bytes", str.size(), cut);
    return str.substr(0, cut) + kTruncationMarker;
}

std::string StringUtils::Abbreviate(const std::string& str, std::size_t max_length) {
    if (str.length() <= max_length) {
        return str;
    }
    const std::string suffix = "...";
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace codebox
