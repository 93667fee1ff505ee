/**
 * @file config.hpp
 * @brief Startup configuration for code execution
 *
 * Settings are layered: built-in defaults, then an optional JSON file, then
 * `CODEBOX_*` environment variables, then command line flags applied by the
 * caller. Each layer only overrides the keys it names.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/resource_limits.hpp"
#include "codebox/utils/cluster_utils.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @class ConfigError
 * @brief Raised for malformed or inconsistent configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct Settings
 * @brief Every recognized configuration option with its default
 *
 * Environment variable names are the upper-cased field names prefixed with
 * `CODEBOX_` (`timeout_seconds` is read from `CODEBOX_TIMEOUT`,
 * `enable_code_execution` from `CODEBOX_ENABLE_CODE_EXECUTION`). JSON keys
 * are the field names.
 *
 * **Example**:
 * ```cpp
 * auto settings = Settings::Load("codebox.json");
 * settings.Validate();
 * auto limits = settings.BuildLimits();
 * ```
 */
struct Settings {
    static constexpr const char* kContainerBackend = "container-engine";
    static constexpr const char* kClusterBackend = "cluster-job";

    // Feature flag and backend
    bool enable_code_execution{false};
    std::string backend{kContainerBackend};

    // Limits
    std::string limits_preset;                ///< Empty: use the explicit values below
    int timeout_seconds{30};
    int memory_limit_mb{512};
    double cpu_quota{1.0};
    int disk_quota_mb{100};
    int max_processes{1};
    std::string network_mode{"none"};
    std::vector<std::string> allowed_domains;
    std::vector<std::string> allowed_imports; ///< Empty: default allow-list

    // Container engine
    std::string image{"python:3.12-slim"};
    std::string docker_socket{"/var/run/docker.sock"};
    bool docker_storage_opt{false};

    // Cluster
    std::string k8s_namespace{"default"};
    int k8s_job_ttl{300};
    bool k8s_in_cluster{true};
    std::string k8s_api_server;
    std::string k8s_token;
    std::string k8s_token_file;
    std::string k8s_ca_file;
    std::string k8s_client_cert;
    std::string k8s_client_key;
    bool k8s_insecure_skip_tls_verify{false};
    bool k8s_network_policy{true};

    std::string log_level{"info"};

    /**
     * @brief Defaults overridden by `CODEBOX_*` variables
     * @throws ConfigError for values that do not parse
     */
    static Settings FromEnvironment(const utils::EnvLookup& env = utils::ProcessEnvironment);

    /**
     * @brief Defaults overridden by a JSON object file
     * @throws ConfigError if the file is unreadable, not an object, or mistyped
     */
    static Settings FromJsonFile(const std::string& path);

    /**
     * @brief Defaults, then `json_path` (if not empty), then the environment
     */
    static Settings Load(const std::string& json_path = "",
                         const utils::EnvLookup& env = utils::ProcessEnvironment);

    /// Override fields present in `json`
    void ApplyJson(const nlohmann::json& json);

    /// Override fields whose `CODEBOX_*` variable is set
    void ApplyEnvironment(const utils::EnvLookup& env);

    /**
     * @brief Effective settings; the bearer token is masked
     */
    nlohmann::json ToJson() const;

    /**
     * @brief Check ranges, names and backend-specific requirements
     * @throws ConfigError describing the first problem found
     */
    void Validate() const;

    /**
     * @brief Preset when one is named, otherwise the explicit values
     * @throws ConfigError if the limits are out of range
     */
    ResourceLimits BuildLimits() const;

    /// Configured import allow-list, or the validator default when empty
    std::set<std::string> AllowedImportSet() const;

    /**
     * @brief Map a backend name or alias to "container-engine" or "cluster-job"
     *
     * "docker-engine" and "docker" are accepted for the container backend,
     * "kubernetes" and "k8s" for the cluster backend.
     *
     * @throws ConfigError for unknown names
     */
    static std::string CanonicalBackend(const std::string& name);

    /// Whether `CanonicalBackend` accepts `name`
    static bool IsKnownBackend(const std::string& name);
};

} // namespace core
} // namespace codebox
