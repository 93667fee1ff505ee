/**
 * @file hash_utils.cpp
 * @brief Implementation of digest and random identifier helpers
 *
 * @date 2025
 */

#include "codebox/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace codebox {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ShortDigest(const std::string& data, std::size_t length) {
    return ComputeSHA256(data).substr(0, length);
}

std::string HashUtils::RandomHex(std::size_t length) {
    std::vector<unsigned char> bytes((length + 1) / 2);
    if (!bytes.empty() && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("OpenSSL RAND_bytes failed");
    }
    return BinaryToHex(bytes.data(), bytes.size()).substr(0, length);
}

} // namespace utils
} // namespace codebox
