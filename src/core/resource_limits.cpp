/**
 * @file resource_limits.cpp
 * @brief Implementation of ResourceLimits validation, presets and serialization
 *
 * @date 2025
 */

#include "codebox/core/resource_limits.hpp"
#include "codebox/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <regex>

namespace codebox {
namespace core {

using utils::StringUtils;

namespace {

constexpr double kCpuEpsilon = 1e-9;

std::vector<std::string> NormalizeDomains(const std::vector<std::string>& domains) {
    std::vector<std::string> normalized;
    for (const auto& domain : domains) {
        auto entry = StringUtils::ToLower(StringUtils::Trim(domain));
        if (entry.empty()) {
            continue;
        }
        if (std::find(normalized.begin(), normalized.end(), entry) == normalized.end()) {
            normalized.push_back(entry);
        }
    }
    return normalized;
}

bool IsValidHostname(const std::string& domain) {
    static const std::regex hostname_pattern(
        R"(^(\*\.)?([a-z0-9]([a-z0-9-]{0,61}[a-z0-9])?\.)*[a-z0-9]([a-z0-9-]{0,61}[a-z0-9])?$)");
    return domain.size() <= 253 && std::regex_match(domain, hostname_pattern);
}

template <typename T>
void CheckRange(const char* field, T value, T min, T max) {
    if (value < min || value > max) {
        throw ResourceLimitError(fmt::format("{} must be between {} and {} (got {})",
                                             field, min, max, value));
    }
}

} // anonymous namespace

// ============================================================================
// NETWORK MODE
// ============================================================================

std::string NetworkModeToString(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::NONE: return "none";
        case NetworkMode::ALLOWLIST: return "allowlist";
        case NetworkMode::UNRESTRICTED: return "unrestricted";
    }
    return "none";
}

NetworkMode ParseNetworkMode(const std::string& name) {
    const auto lowered = StringUtils::ToLower(StringUtils::Trim(name));
    if (lowered == "none") return NetworkMode::NONE;
    if (lowered == "allowlist") return NetworkMode::ALLOWLIST;
    if (lowered == "unrestricted") return NetworkMode::UNRESTRICTED;
    throw ResourceLimitError("Unknown network mode '" + name +
                             "' (expected none, allowlist or unrestricted)");
}

// ============================================================================
// CONSTRUCTION AND VALIDATION
// ============================================================================

ResourceLimits::ResourceLimits()
    : ResourceLimits(30, 512, 1.0, 100, 1, NetworkMode::NONE, {}) {}

ResourceLimits::ResourceLimits(int timeout_seconds,
                               int memory_limit_mb,
                               double cpu_quota,
                               int disk_quota_mb,
                               int max_processes,
                               NetworkMode network_mode,
                               std::vector<std::string> allowed_domains)
    : timeout_seconds_(timeout_seconds),
      memory_limit_mb_(memory_limit_mb),
      cpu_quota_(cpu_quota),
      disk_quota_mb_(disk_quota_mb),
      max_processes_(max_processes),
      network_mode_(network_mode),
      allowed_domains_(NormalizeDomains(allowed_domains)) {
    Validate();
}

void ResourceLimits::Validate() const {
    CheckRange("timeout_seconds", timeout_seconds_, kMinTimeoutSeconds, kMaxTimeoutSeconds);
    CheckRange("memory_limit_mb", memory_limit_mb_, kMinMemoryMb, kMaxMemoryMb);
    if (!std::isfinite(cpu_quota_) ||
        cpu_quota_ < kMinCpuQuota - kCpuEpsilon || cpu_quota_ > kMaxCpuQuota + kCpuEpsilon) {
        throw ResourceLimitError(fmt::format("cpu_quota must be between {} and {} (got {})",
                                             kMinCpuQuota, kMaxCpuQuota, cpu_quota_));
    }
    CheckRange("disk_quota_mb", disk_quota_mb_, kMinDiskQuotaMb, kMaxDiskQuotaMb);
    CheckRange("max_processes", max_processes_, kMinProcesses, kMaxProcesses);

    for (const auto& domain : allowed_domains_) {
        if (!IsValidHostname(domain)) {
            throw ResourceLimitError("Invalid domain in allowed_domains: '" + domain + "'");
        }
    }
}

// ============================================================================
// PRESETS
// ============================================================================

ResourceLimits ResourceLimits::Development() {
    return ResourceLimits(300, 2048, 2.0, 1024, 10, NetworkMode::UNRESTRICTED);
}

ResourceLimits ResourceLimits::Production() {
    return ResourceLimits(30, 512, 1.0, 100, 1, NetworkMode::ALLOWLIST);
}

ResourceLimits ResourceLimits::Testing() {
    return ResourceLimits(10, 256, 0.5, 50, 1, NetworkMode::NONE);
}

ResourceLimits ResourceLimits::DataProcessing() {
    return ResourceLimits(300, 4096, 4.0, 2048, 4, NetworkMode::NONE);
}

ResourceLimits ResourceLimits::FromPreset(const std::string& name) {
    auto key = StringUtils::ToLower(StringUtils::Trim(name));
    std::replace(key.begin(), key.end(), '-', '_');

    if (key == "development") return Development();
    if (key == "production") return Production();
    if (key == "testing") return Testing();
    if (key == "data_processing") return DataProcessing();

    throw ResourceLimitError("Unknown resource limits preset '" + name + "' (expected one of " +
                             StringUtils::Join(PresetNames(), ", ") + ")");
}

std::vector<std::string> ResourceLimits::PresetNames() {
    return {"development", "production", "testing", "data_processing"};
}

// ============================================================================
// SERIALIZATION
// ============================================================================

nlohmann::json ResourceLimits::ToJson() const {
    return nlohmann::json{
        {"timeout_seconds", timeout_seconds_},
        {"memory_limit_mb", memory_limit_mb_},
        {"cpu_quota", cpu_quota_},
        {"disk_quota_mb", disk_quota_mb_},
        {"max_processes", max_processes_},
        {"network_mode", NetworkModeToString(network_mode_)},
        {"allowed_domains", allowed_domains_}
    };
}

ResourceLimits ResourceLimits::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ResourceLimitError("Resource limits must be a JSON object");
    }

    const ResourceLimits defaults;
    try {
        return ResourceLimits(
            json.value("timeout_seconds", defaults.timeout_seconds_),
            json.value("memory_limit_mb", defaults.memory_limit_mb_),
            json.value("cpu_quota", defaults.cpu_quota_),
            json.value("disk_quota_mb", defaults.disk_quota_mb_),
            json.value("max_processes", defaults.max_processes_),
            ParseNetworkMode(json.value("network_mode", std::string("none"))),
            json.value("allowed_domains", std::vector<std::string>{}));
    } catch (const nlohmann::json::exception& e) {
        throw ResourceLimitError(std::string("Malformed resource limits: ") + e.what());
    }
}

// ============================================================================
// DERIVATION AND COMPARISON
// ============================================================================

ResourceLimits ResourceLimits::WithTimeout(int timeout_seconds) const {
    return ResourceLimits(timeout_seconds, memory_limit_mb_, cpu_quota_, disk_quota_mb_,
                          max_processes_, network_mode_, allowed_domains_);
}

bool ResourceLimits::IsWithin(const ResourceLimits& other) const {
    return timeout_seconds_ <= other.timeout_seconds_ &&
           memory_limit_mb_ <= other.memory_limit_mb_ &&
           cpu_quota_ <= other.cpu_quota_ + kCpuEpsilon &&
           disk_quota_mb_ <= other.disk_quota_mb_ &&
           max_processes_ <= other.max_processes_;
}

std::string ResourceLimits::ToString() const {
    auto text = fmt::format(
        "ResourceLimits(timeout={}s, memory={}MB, cpu={:.2f}, disk={}MB, processes={}, network={}",
        timeout_seconds_, memory_limit_mb_, cpu_quota_, disk_quota_mb_, max_processes_,
        NetworkModeToString(network_mode_));
    if (network_mode_ == NetworkMode::ALLOWLIST) {
        text += ", domains=[" + StringUtils::Join(allowed_domains_, ",") + "]";
    }
    return text + ")";
}

bool ResourceLimits::operator==(const ResourceLimits& other) const {
    return timeout_seconds_ == other.timeout_seconds_ &&
           memory_limit_mb_ == other.memory_limit_mb_ &&
           std::fabs(cpu_quota_ - other.cpu_quota_) < kCpuEpsilon &&
           disk_quota_mb_ == other.disk_quota_mb_ &&
           max_processes_ == other.max_processes_ &&
           network_mode_ == other.network_mode_ &&
           allowed_domains_ == other.allowed_domains_;
}

} // namespace core
} // namespace codebox
