/**
 * @file resource_limits.hpp
 * @brief Immutable, validated execution constraints for one sandbox invocation
 *
 * Defines ResourceLimits (CPU, memory, wall-clock timeout, disk quota,
 * process ceiling and network policy), the named presets, and a fluent
 * builder. Every constructor validates all bounds; an instance that exists
 * is always within range.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codebox {
namespace core {

/**
 * @enum NetworkMode
 * @brief Network policy applied to a sandbox unit
 */
enum class NetworkMode {
    NONE,           ///< No network interface besides loopback
    ALLOWLIST,      ///< Egress only to allowed_domains (backends may fail closed)
    UNRESTRICTED    ///< Default runtime networking
};

/**
 * @brief Convert network mode to its configuration name ("none", "allowlist", "unrestricted")
 */
std::string NetworkModeToString(NetworkMode mode);

/**
 * @brief Parse a configuration name into a NetworkMode (case-insensitive)
 * @throws ResourceLimitError for unknown names
 */
NetworkMode ParseNetworkMode(const std::string& name);

/**
 * @class ResourceLimitError
 * @brief Raised when a limit is out of range or a preset name is unknown
 */
class ResourceLimitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ResourceLimits
 * @brief Immutable bundle of execution constraints
 *
 * **Bounds** (inclusive):
 * - timeout_seconds: 1 - 600
 * - memory_limit_mb: 64 - 16384
 * - cpu_quota: 0.1 - 8.0 cores
 * - disk_quota_mb: 1 - 10240
 * - max_processes: 1 - 100
 *
 * There are no setters. WithTimeout() and ResourceLimitsBuilder produce new
 * validated instances.
 *
 * **Usage Example**:
 * @code
 * auto limits = ResourceLimits::Production().WithTimeout(10);
 * auto custom = ResourceLimitsBuilder()
 *     .WithMemoryLimit(1024)
 *     .WithCpuQuota(2.0)
 *     .Build();
 * @endcode
 */
class ResourceLimits {
public:
    static constexpr int kMinTimeoutSeconds = 1;
    static constexpr int kMaxTimeoutSeconds = 600;
    static constexpr int kMinMemoryMb = 64;
    static constexpr int kMaxMemoryMb = 16384;
    static constexpr double kMinCpuQuota = 0.1;
    static constexpr double kMaxCpuQuota = 8.0;
    static constexpr int kMinDiskQuotaMb = 1;
    static constexpr int kMaxDiskQuotaMb = 10240;
    static constexpr int kMinProcesses = 1;
    static constexpr int kMaxProcesses = 100;

    /**
     * @brief Default limits: 30s, 512MB, 1 core, 100MB disk, 1 process, no network
     */
    ResourceLimits();

    /**
     * @brief Construct from explicit fields
     * @throws ResourceLimitError if any field is out of range or a domain is malformed
     */
    ResourceLimits(int timeout_seconds,
                   int memory_limit_mb,
                   double cpu_quota,
                   int disk_quota_mb,
                   int max_processes,
                   NetworkMode network_mode = NetworkMode::NONE,
                   std::vector<std::string> allowed_domains = {});

    /***************************************************************************
     * Presets
     ***************************************************************************/

    /// Long timeout, generous memory, multi-core, unrestricted network
    static ResourceLimits Development();

    /// Tight timeout, conservative memory/CPU, allowlist network with no domains
    static ResourceLimits Production();

    /// Minimal resources for fast feedback
    static ResourceLimits Testing();

    /// Long timeout, high memory/CPU for bulk workloads
    static ResourceLimits DataProcessing();

    /**
     * @brief Resolve a preset by name
     *
     * Accepts "development", "production", "testing" and "data_processing"
     * (case-insensitive, '-' accepted for '_').
     *
     * @throws ResourceLimitError for unknown names
     */
    static ResourceLimits FromPreset(const std::string& name);

    /**
     * @brief Names of all presets
     */
    static std::vector<std::string> PresetNames();

    /***************************************************************************
     * Serialization
     ***************************************************************************/

    nlohmann::json ToJson() const;

    /**
     * @brief Build from JSON; missing fields take default values
     * @throws ResourceLimitError on out-of-range or mistyped fields
     */
    static ResourceLimits FromJson(const nlohmann::json& json);

    /***************************************************************************
     * Derivation and Comparison
     ***************************************************************************/

    /**
     * @brief Copy with a different timeout
     * @throws ResourceLimitError if the timeout is out of range
     */
    ResourceLimits WithTimeout(int timeout_seconds) const;

    /**
     * @brief True if every numeric limit is less than or equal to other's
     */
    bool IsWithin(const ResourceLimits& other) const;

    std::string ToString() const;

    bool operator==(const ResourceLimits& other) const;
    bool operator!=(const ResourceLimits& other) const { return !(*this == other); }

    // Accessors
    int TimeoutSeconds() const { return timeout_seconds_; }
    int MemoryLimitMb() const { return memory_limit_mb_; }
    double CpuQuota() const { return cpu_quota_; }
    int DiskQuotaMb() const { return disk_quota_mb_; }
    int MaxProcesses() const { return max_processes_; }
    NetworkMode GetNetworkMode() const { return network_mode_; }
    const std::vector<std::string>& AllowedDomains() const { return allowed_domains_; }

private:
    void Validate() const;

    int timeout_seconds_;
    int memory_limit_mb_;
    double cpu_quota_;
    int disk_quota_mb_;
    int max_processes_;
    NetworkMode network_mode_;
    std::vector<std::string> allowed_domains_;
};

/**
 * @class ResourceLimitsBuilder
 * @brief Fluent API for constructing ResourceLimits
 *
 * Starts from the defaults (or a given base) and validates once in Build().
 *
 * **Usage Example**:
 * @code
 * auto limits = ResourceLimitsBuilder(ResourceLimits::Testing())
 *     .WithTimeout(5)
 *     .WithNetworkMode(NetworkMode::ALLOWLIST)
 *     .AllowDomain("pypi.org")
 *     .Build();
 * @endcode
 */
class ResourceLimitsBuilder {
public:
    ResourceLimitsBuilder() = default;

    explicit ResourceLimitsBuilder(const ResourceLimits& base)
        : timeout_seconds_(base.TimeoutSeconds()),
          memory_limit_mb_(base.MemoryLimitMb()),
          cpu_quota_(base.CpuQuota()),
          disk_quota_mb_(base.DiskQuotaMb()),
          max_processes_(base.MaxProcesses()),
          network_mode_(base.GetNetworkMode()),
          allowed_domains_(base.AllowedDomains()) {}

    ResourceLimitsBuilder& WithTimeout(int seconds) {
        timeout_seconds_ = seconds;
        return *this;
    }

    ResourceLimitsBuilder& WithMemoryLimit(int mb) {
        memory_limit_mb_ = mb;
        return *this;
    }

    ResourceLimitsBuilder& WithCpuQuota(double cores) {
        cpu_quota_ = cores;
        return *this;
    }

    ResourceLimitsBuilder& WithDiskQuota(int mb) {
        disk_quota_mb_ = mb;
        return *this;
    }

    ResourceLimitsBuilder& WithMaxProcesses(int count) {
        max_processes_ = count;
        return *this;
    }

    ResourceLimitsBuilder& WithNetworkMode(NetworkMode mode) {
        network_mode_ = mode;
        return *this;
    }

    ResourceLimitsBuilder& AllowDomain(const std::string& domain) {
        allowed_domains_.push_back(domain);
        return *this;
    }

    ResourceLimitsBuilder& WithAllowedDomains(std::vector<std::string> domains) {
        allowed_domains_ = std::move(domains);
        return *this;
    }

    /**
     * @brief Validate and build
     * @throws ResourceLimitError if any field is out of range
     */
    ResourceLimits Build() const {
        return ResourceLimits(timeout_seconds_, memory_limit_mb_, cpu_quota_,
                              disk_quota_mb_, max_processes_, network_mode_,
                              allowed_domains_);
    }

private:
    int timeout_seconds_{30};
    int memory_limit_mb_{512};
    double cpu_quota_{1.0};
    int disk_quota_mb_{100};
    int max_processes_{1};
    NetworkMode network_mode_{NetworkMode::NONE};
    std::vector<std::string> allowed_domains_;
};

} // namespace core
} // namespace codebox
