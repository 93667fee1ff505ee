/**
 * @file hash_utils.hpp
 * @brief Digest and random identifier helpers backed by OpenSSL
 *
 * Used to derive stable, collision-resistant names for ephemeral sandbox
 * units (containers and cluster jobs) and to fingerprint submitted code in
 * log lines without logging the code itself.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace codebox {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Thread Safety**: All methods are stateless and safe to call concurrently.
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256("print(1)");
 * std::string suffix = HashUtils::RandomHex(4);   // e.g. "9f3a"
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a string
     * @param data Input bytes
     * @return 64 lowercase hex characters
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Short fingerprint: the first `length` hex characters of SHA-256
     */
    static std::string ShortDigest(const std::string& data, std::size_t length = 8);

    /**
     * @brief Cryptographically random hex string
     *
     * @param length Number of hex characters to produce
     * @return Lowercase hex string of exactly `length` characters
     * @throws std::runtime_error if the OpenSSL RNG fails
     */
    static std::string RandomHex(std::size_t length);

    /**
     * @brief Convert raw bytes to lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace codebox
