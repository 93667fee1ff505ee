/**
 * @file config.cpp
 * @brief Settings loading, validation and serialization
 *
 * @date 2025
 */

#include "codebox/core/config.hpp"
#include "codebox/analyzers/code_validator.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace codebox {
namespace core {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

template <typename T>
struct Field {
    const char* key;
    const char* env;
    T Settings::*member;
};

const Field<bool> kBoolFields[] = {
    {"enable_code_execution", "CODEBOX_ENABLE_CODE_EXECUTION", &Settings::enable_code_execution},
    {"docker_storage_opt", "CODEBOX_DOCKER_STORAGE_OPT", &Settings::docker_storage_opt},
    {"k8s_in_cluster", "CODEBOX_K8S_IN_CLUSTER", &Settings::k8s_in_cluster},
    {"k8s_insecure_skip_tls_verify", "CODEBOX_K8S_INSECURE_SKIP_TLS_VERIFY", &Settings::k8s_insecure_skip_tls_verify},
    {"k8s_network_policy", "CODEBOX_K8S_NETWORK_POLICY", &Settings::k8s_network_policy},
};

const Field<int> kIntFields[] = {
    {"timeout_seconds", "CODEBOX_TIMEOUT", &Settings::timeout_seconds},
    {"memory_limit_mb", "CODEBOX_MEMORY_LIMIT_MB", &Settings::memory_limit_mb},
    {"disk_quota_mb", "CODEBOX_DISK_QUOTA_MB", &Settings::disk_quota_mb},
    {"max_processes", "CODEBOX_MAX_PROCESSES", &Settings::max_processes},
    {"k8s_job_ttl", "CODEBOX_K8S_JOB_TTL", &Settings::k8s_job_ttl},
};

const Field<double> kDoubleFields[] = {
    {"cpu_quota", "CODEBOX_CPU_QUOTA", &Settings::cpu_quota},
};

const Field<std::string> kStringFields[] = {
    {"backend", "CODEBOX_BACKEND", &Settings::backend},
    {"limits_preset", "CODEBOX_LIMITS_PRESET", &Settings::limits_preset},
    {"network_mode", "CODEBOX_NETWORK_MODE", &Settings::network_mode},
    {"image", "CODEBOX_IMAGE", &Settings::image},
    {"docker_socket", "CODEBOX_DOCKER_SOCKET", &Settings::docker_socket},
    {"k8s_namespace", "CODEBOX_K8S_NAMESPACE", &Settings::k8s_namespace},
    {"k8s_api_server", "CODEBOX_K8S_API_SERVER", &Settings::k8s_api_server},
    {"k8s_token", "CODEBOX_K8S_TOKEN", &Settings::k8s_token},
    {"k8s_token_file", "CODEBOX_K8S_TOKEN_FILE", &Settings::k8s_token_file},
    {"k8s_ca_file", "CODEBOX_K8S_CA_FILE", &Settings::k8s_ca_file},
    {"k8s_client_cert", "CODEBOX_K8S_CLIENT_CERT", &Settings::k8s_client_cert},
    {"k8s_client_key", "CODEBOX_K8S_CLIENT_KEY", &Settings::k8s_client_key},
    {"log_level", "CODEBOX_LOG_LEVEL", &Settings::log_level},
};

const Field<std::vector<std::string>> kListFields[] = {
    {"allowed_domains", "CODEBOX_ALLOWED_DOMAINS", &Settings::allowed_domains},
    {"allowed_imports", "CODEBOX_ALLOWED_IMPORTS", &Settings::allowed_imports},
};

// ============================================================================
// VALUE PARSING
// ============================================================================

bool ParseBool(const std::string& raw, const std::string& name) {
    const std::string value = StringUtils::ToLower(StringUtils::Trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw ConfigError(fmt::format("{} must be a boolean, got '{}'", name, raw));
}

int ParseInt(const std::string& raw, const std::string& name) {
    const std::string value = StringUtils::Trim(raw);
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (value.empty() || consumed != value.size()) {
        throw ConfigError(fmt::format("{} must be an integer, got '{}'", name, raw));
    }
    return parsed;
}

double ParseDouble(const std::string& raw, const std::string& name) {
    const std::string value = StringUtils::Trim(raw);
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (value.empty() || consumed != value.size()) {
        throw ConfigError(fmt::format("{} must be a number, got '{}'", name, raw));
    }
    return parsed;
}

std::vector<std::string> ParseList(const std::string& raw, const std::string& name) {
    try {
        return StringUtils::SplitList(raw);
    } catch (const std::runtime_error& e) {
        throw ConfigError(fmt::format("{} is not a valid list: {}", name, e.what()));
    }
}

bool JsonBool(const json& value, const std::string& key) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return ParseBool(value.get<std::string>(), key);
    }
    throw ConfigError(fmt::format("Setting '{}' must be a boolean", key));
}

int JsonInt(const json& value, const std::string& key) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        return ParseInt(value.get<std::string>(), key);
    }
    throw ConfigError(fmt::format("Setting '{}' must be an integer", key));
}

double JsonDouble(const json& value, const std::string& key) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return ParseDouble(value.get<std::string>(), key);
    }
    throw ConfigError(fmt::format("Setting '{}' must be a number", key));
}

std::string JsonString(const json& value, const std::string& key) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    throw ConfigError(fmt::format("Setting '{}' must be a string", key));
}

std::vector<std::string> JsonList(const json& value, const std::string& key) {
    if (value.is_string()) {
        return ParseList(value.get<std::string>(), key);
    }
    if (!value.is_array()) {
        throw ConfigError(fmt::format("Setting '{}' must be an array of strings", key));
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError(fmt::format("Setting '{}' must be an array of strings", key));
        }
        const std::string trimmed = StringUtils::Trim(item.get<std::string>());
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    return items;
}

std::set<std::string> KnownKeys() {
    std::set<std::string> keys;
    for (const auto& f : kBoolFields) keys.insert(f.key);
    for (const auto& f : kIntFields) keys.insert(f.key);
    for (const auto& f : kDoubleFields) keys.insert(f.key);
    for (const auto& f : kStringFields) keys.insert(f.key);
    for (const auto& f : kListFields) keys.insert(f.key);
    return keys;
}

bool IsDnsLabel(const std::string& name) {
    if (name.empty() || name.size() > 63) {
        return false;
    }
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '-')) {
            return false;
        }
    }
    return name.front() != '-' && name.back() != '-';
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

Settings Settings::FromEnvironment(const utils::EnvLookup& env) {
    Settings settings;
    settings.ApplyEnvironment(env);
    return settings;
}

Settings Settings::FromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError(fmt::format("Cannot open configuration file {}", path));
    }
    json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        throw ConfigError(fmt::format("Configuration file {} is not valid JSON", path));
    }
    if (!document.is_object()) {
        throw ConfigError(fmt::format("Configuration file {} must contain a JSON object", path));
    }

    Settings settings;
    settings.ApplyJson(document);
    spdlog::debug("Loaded configuration file {}", path);
    return settings;
}

Settings Settings::Load(const std::string& json_path, const utils::EnvLookup& env) {
    Settings settings = json_path.empty() ? Settings{} : FromJsonFile(json_path);
    settings.ApplyEnvironment(env);
    return settings;
}

void Settings::ApplyJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Settings must be a JSON object");
    }

    for (const auto& f : kBoolFields) {
        if (document.contains(f.key)) this->*f.member = JsonBool(document[f.key], f.key);
    }
    for (const auto& f : kIntFields) {
        if (document.contains(f.key)) this->*f.member = JsonInt(document[f.key], f.key);
    }
    for (const auto& f : kDoubleFields) {
        if (document.contains(f.key)) this->*f.member = JsonDouble(document[f.key], f.key);
    }
    for (const auto& f : kStringFields) {
        if (document.contains(f.key)) this->*f.member = JsonString(document[f.key], f.key);
    }
    for (const auto& f : kListFields) {
        if (document.contains(f.key)) this->*f.member = JsonList(document[f.key], f.key);
    }

    static const std::set<std::string> known = KnownKeys();
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (known.count(it.key()) == 0) {
            spdlog::warn("Ignoring unknown setting '{}'", it.key());
        }
    }
}

void Settings::ApplyEnvironment(const utils::EnvLookup& env) {
    for (const auto& f : kBoolFields) {
        if (auto raw = env(f.env)) this->*f.member = ParseBool(*raw, f.env);
    }
    for (const auto& f : kIntFields) {
        if (auto raw = env(f.env)) this->*f.member = ParseInt(*raw, f.env);
    }
    for (const auto& f : kDoubleFields) {
        if (auto raw = env(f.env)) this->*f.member = ParseDouble(*raw, f.env);
    }
    for (const auto& f : kStringFields) {
        if (auto raw = env(f.env)) this->*f.member = StringUtils::Trim(*raw);
    }
    for (const auto& f : kListFields) {
        if (auto raw = env(f.env)) this->*f.member = ParseList(*raw, f.env);
    }
}

json Settings::ToJson() const {
    json document = json::object();
    for (const auto& f : kBoolFields) document[f.key] = this->*f.member;
    for (const auto& f : kIntFields) document[f.key] = this->*f.member;
    for (const auto& f : kDoubleFields) document[f.key] = this->*f.member;
    for (const auto& f : kStringFields) document[f.key] = this->*f.member;
    for (const auto& f : kListFields) document[f.key] = this->*f.member;

    if (!k8s_token.empty()) {
        document["k8s_token"] = "***";
    }
    return document;
}

// ============================================================================
// VALIDATION
// ============================================================================

void Settings::Validate() const {
    const std::string canonical = CanonicalBackend(backend);

    try {
        ParseNetworkMode(network_mode);
    } catch (const ResourceLimitError& e) {
        throw ConfigError(e.what());
    }
    BuildLimits();

    if (StringUtils::IsBlank(image)) {
        throw ConfigError("image must not be empty");
    }

    static const std::set<std::string> levels{
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
    };
    if (levels.count(StringUtils::ToLower(log_level)) == 0) {
        throw ConfigError(fmt::format("Unknown log level '{}'", log_level));
    }

    if (canonical == kContainerBackend && StringUtils::IsBlank(docker_socket)) {
        throw ConfigError("docker_socket must not be empty for the container-engine backend");
    }

    if (!IsDnsLabel(k8s_namespace)) {
        throw ConfigError(fmt::format("'{}' is not a valid namespace name", k8s_namespace));
    }
    if (k8s_job_ttl < 0) {
        throw ConfigError("k8s_job_ttl must not be negative");
    }
    if (canonical == kClusterBackend && !k8s_in_cluster && StringUtils::IsBlank(k8s_api_server)) {
        throw ConfigError("k8s_api_server is required when k8s_in_cluster is false");
    }
}

ResourceLimits Settings::BuildLimits() const {
    try {
        if (!StringUtils::IsBlank(limits_preset)) {
            const ResourceLimits preset = ResourceLimits::FromPreset(limits_preset);
            const Settings defaults;
            if (timeout_seconds != defaults.timeout_seconds || memory_limit_mb != defaults.memory_limit_mb ||
                cpu_quota != defaults.cpu_quota || disk_quota_mb != defaults.disk_quota_mb ||
                max_processes != defaults.max_processes || network_mode != defaults.network_mode) {
                spdlog::warn("limits_preset '{}' is set; explicit limit values are ignored", limits_preset);
            }
            if (allowed_domains.empty()) {
                return preset;
            }
            if (preset.GetNetworkMode() != NetworkMode::ALLOWLIST) {
                spdlog::warn("limits_preset '{}' has network mode '{}'; allowed_domains are ignored",
                             limits_preset, NetworkModeToString(preset.GetNetworkMode()));
                return preset;
            }
            ResourceLimitsBuilder builder(preset);
            for (const auto& domain : allowed_domains) {
                const auto& present = preset.AllowedDomains();
                if (std::find(present.begin(), present.end(), domain) == present.end()) {
                    builder.AllowDomain(domain);
                }
            }
            return builder.Build();
        }
        return ResourceLimits(timeout_seconds, memory_limit_mb, cpu_quota, disk_quota_mb,
                              max_processes, ParseNetworkMode(network_mode), allowed_domains);
    } catch (const ResourceLimitError& e) {
        throw ConfigError(fmt::format("Invalid resource limits: {}", e.what()));
    }
}

std::set<std::string> Settings::AllowedImportSet() const {
    if (allowed_imports.empty()) {
        return analyzers::CodeValidator::DefaultAllowedImports();
    }
    return std::set<std::string>(allowed_imports.begin(), allowed_imports.end());
}

std::string Settings::CanonicalBackend(const std::string& name) {
    const std::string value = StringUtils::ToLower(StringUtils::Trim(name));
    if (value == kContainerBackend || value == "docker-engine" || value == "docker") {
        return kContainerBackend;
    }
    if (value == kClusterBackend || value == "kubernetes" || value == "k8s") {
        return kClusterBackend;
    }
    throw ConfigError(fmt::format(
        "Unknown backend '{}' (expected container-engine, docker-engine, cluster-job or kubernetes)", name));
}

bool Settings::IsKnownBackend(const std::string& name) {
    try {
        CanonicalBackend(name);
        return true;
    } catch (const ConfigError&) {
        return false;
    }
}

} // namespace core
} // namespace codebox
