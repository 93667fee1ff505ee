/**
 * @file container_utils.cpp
 * @brief Docker Engine API client implementation
 *
 * **API Endpoints Used**:
 * - `GET /_ping`: daemon liveness
 * - `GET /images/{name}/json`, `POST /images/create`: image inspect and pull
 * - `POST /containers/create`, `POST /containers/{id}/start`
 * - `GET /containers/{id}/json`: state polling
 * - `POST /containers/{id}/kill`: forced termination
 * - `GET /containers/{id}/logs`: multiplexed stdout/stderr
 * - `GET /containers/{id}/stats?stream=false`: memory sample
 * - `DELETE /containers/{id}?force=1&v=1`: removal
 *
 * @date 2025
 */

#include "codebox/utils/container_utils.hpp"
#include "codebox/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace codebox {
namespace utils {

using json = nlohmann::json;

namespace {

constexpr std::size_t kFrameHeaderSize = 8;
constexpr std::chrono::seconds kPullTimeout{600};

// Docker reports errors as {"message": "..."}
std::string ApiMessage(const HttpResponse& response) {
    try {
        auto body = json::parse(response.body);
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    }
    catch (const json::parse_error&) {
        // Not JSON; fall through to the raw body
    }
    return StringUtils::Abbreviate(StringUtils::Trim(response.body), 200);
}

std::string PathSegment(const std::string& value) {
    return UrlEncode(value);
}

} // anonymous namespace

// ============================================================================
// STATE AND LOG PARSING
// ============================================================================

ContainerState ParseContainerState(const std::string& status) {
    if (status == "created") return ContainerState::CREATED;
    if (status == "running") return ContainerState::RUNNING;
    if (status == "paused") return ContainerState::PAUSED;
    if (status == "restarting") return ContainerState::RESTARTING;
    if (status == "removing") return ContainerState::REMOVING;
    if (status == "exited") return ContainerState::EXITED;
    if (status == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

ContainerLogs DemultiplexLogs(const std::string& raw) {
    ContainerLogs logs;
    if (raw.empty()) {
        return logs;
    }

    const auto first = static_cast<unsigned char>(raw[0]);
    const bool framed = raw.size() >= kFrameHeaderSize && first <= 2 &&
                        raw[1] == '\0' && raw[2] == '\0' && raw[3] == '\0';
    if (!framed) {
        logs.stdout_output = raw;
        return logs;
    }

    std::size_t offset = 0;
    while (offset + kFrameHeaderSize <= raw.size()) {
        const auto stream = static_cast<unsigned char>(raw[offset]);
        const std::size_t length =
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[offset + 4])) << 24) |
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[offset + 5])) << 16) |
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[offset + 6])) << 8) |
            static_cast<std::size_t>(static_cast<unsigned char>(raw[offset + 7]));
        offset += kFrameHeaderSize;

        const std::size_t available = std::min(length, raw.size() - offset);
        std::string& target = stream == 2 ? logs.stderr_output : logs.stdout_output;
        target.append(raw, offset, available);
        offset += available;
    }
    return logs;
}

std::pair<std::string, std::string> SplitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }
    const auto colon = image.rfind(':');
    const auto slash = image.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

// ============================================================================
// CONTAINER CONFIG
// ============================================================================

json ContainerConfig::ToCreateBody() const {
    json env = json::array();
    for (const auto& [key, value] : environment_vars) {
        env.push_back(key + "=" + value);
    }

    json tmpfs = json::object();
    for (const auto& path : tmpfs_paths) {
        tmpfs[path] = fmt::format("rw,noexec,nosuid,size={}m,mode=1777", tmpfs_size_mb);
    }

    const auto memory_bytes = static_cast<std::int64_t>(memory_limit_mb) * 1024 * 1024;

    json host_config = {
        {"Memory", memory_bytes},
        {"MemorySwap", memory_bytes},
        {"NanoCpus", static_cast<std::int64_t>(cpu_limit * 1e9)},
        {"PidsLimit", pids_limit},
        {"ReadonlyRootfs", read_only_rootfs},
        {"SecurityOpt", security_opts},
        {"CapDrop", capabilities_drop},
        {"Privileged", privileged},
        {"Tmpfs", tmpfs},
        {"NetworkMode", network_mode},
        {"Binds", json::array()},
        {"AutoRemove", false}
    };
    if (storage_limit_mb) {
        host_config["StorageOpt"] = {{"size", fmt::format("{}M", *storage_limit_mb)}};
    }

    return json{
        {"Image", image},
        {"Cmd", command},
        {"User", user},
        {"WorkingDir", working_dir},
        {"Env", env},
        {"Labels", labels},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"NetworkDisabled", network_mode == "none"},
        {"HostConfig", host_config}
    };
}

// ============================================================================
// DOCKER ENGINE CLIENT
// ============================================================================

DockerEngineClient::DockerEngineClient(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

std::shared_ptr<HttpTransport> DockerEngineClient::UnixSocketTransport(const std::string& socket_path) {
    CurlTransportConfig config;
    config.base_url = "http://localhost";
    config.unix_socket_path = socket_path;
    return std::make_shared<CurlTransport>(config);
}

HttpResponse DockerEngineClient::Send(const std::string& method, const std::string& path,
                                      const std::string& body) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    return transport_->Send(request);
}

void DockerEngineClient::ThrowApiError(const std::string& action, const HttpResponse& response) const {
    throw DockerApiError(response.status,
                         fmt::format("{} failed (HTTP {}): {}", action, response.status,
                                     ApiMessage(response)));
}

bool DockerEngineClient::Ping() {
    auto response = Send("GET", "/_ping");
    return response.Ok();
}

bool DockerEngineClient::ImageExists(const std::string& image) {
    auto response = Send("GET", "/images/" + PathSegment(image) + "/json");
    if (response.status == 404) {
        return false;
    }
    if (!response.Ok()) {
        ThrowApiError("Image inspect of " + image, response);
    }
    return true;
}

void DockerEngineClient::PullImage(const std::string& image) {
    const auto [repository, tag] = SplitImageReference(image);
    std::string path = "/images/create?fromImage=" + UrlEncode(repository);
    if (!tag.empty()) {
        path += "&tag=" + UrlEncode(tag);
    }

    spdlog::info("Pulling image {}", image);

    HttpRequest request;
    request.method = "POST";
    request.path = path;
    request.timeout = kPullTimeout;
    auto response = transport_->Send(request);
    if (!response.Ok()) {
        ThrowApiError("Pull of " + image, response);
    }

    // Progress is streamed as JSON lines; failures arrive with HTTP 200
    std::istringstream stream(response.body);
    std::string line;
    while (std::getline(stream, line)) {
        if (StringUtils::IsBlank(line)) {
            continue;
        }
        auto event = json::parse(line, nullptr, false);
        if (event.is_object() && event.contains("error")) {
            throw DockerApiError(response.status,
                                 fmt::format("Pull of {} failed: {}", image,
                                             event["error"].is_string()
                                                 ? event["error"].get<std::string>()
                                                 : event["error"].dump()));
        }
    }
    spdlog::info("Image {} pulled", image);
}

std::string DockerEngineClient::CreateContainer(const ContainerConfig& config) {
    std::string path = "/containers/create";
    if (!config.name.empty()) {
        path += "?name=" + UrlEncode(config.name);
    }

    auto response = Send("POST", path, config.ToCreateBody().dump());
    if (response.status != 201) {
        ThrowApiError("Container create", response);
    }

    auto body = json::parse(response.body);
    const std::string id = body.at("Id").get<std::string>();
    if (body.contains("Warnings") && body["Warnings"].is_array()) {
        for (const auto& warning : body["Warnings"]) {
            if (warning.is_string()) {
                spdlog::warn("Docker warning for {}: {}", id.substr(0, 12), warning.get<std::string>());
            }
        }
    }
    return id;
}

void DockerEngineClient::StartContainer(const std::string& container_id) {
    auto response = Send("POST", "/containers/" + PathSegment(container_id) + "/start");
    // 304: already started
    if (!response.Ok() && response.status != 304) {
        ThrowApiError("Container start", response);
    }
}

ContainerInfo DockerEngineClient::InspectContainer(const std::string& container_id) {
    auto response = Send("GET", "/containers/" + PathSegment(container_id) + "/json");
    if (!response.Ok()) {
        ThrowApiError("Container inspect", response);
    }

    auto body = json::parse(response.body);
    ContainerInfo info;
    info.id = body.value("Id", container_id);
    info.name = body.value("Name", "");
    if (body.contains("State") && body["State"].is_object()) {
        const auto& state = body["State"];
        info.state = ParseContainerState(state.value("Status", ""));
        info.exit_code = state.value("ExitCode", 0);
        info.oom_killed = state.value("OOMKilled", false);
        info.error = state.value("Error", "");
    }
    return info;
}

bool DockerEngineClient::KillContainer(const std::string& container_id) {
    auto response = Send("POST", "/containers/" + PathSegment(container_id) + "/kill?signal=SIGKILL");
    // 404: gone, 409: not running
    if (response.status == 404 || response.status == 409) {
        return false;
    }
    if (!response.Ok()) {
        ThrowApiError("Container kill", response);
    }
    return true;
}

bool DockerEngineClient::RemoveContainer(const std::string& container_id) {
    auto response = Send("DELETE", "/containers/" + PathSegment(container_id) + "?force=1&v=1");
    if (response.status == 404) {
        return false;
    }
    if (!response.Ok()) {
        ThrowApiError("Container remove", response);
    }
    return true;
}

ContainerLogs DockerEngineClient::GetContainerLogs(const std::string& container_id) {
    auto response = Send("GET", "/containers/" + PathSegment(container_id) + "/logs?stdout=1&stderr=1");
    if (!response.Ok()) {
        ThrowApiError("Container logs", response);
    }
    auto logs = DemultiplexLogs(response.body);
    logs.truncated = response.truncated;
    return logs;
}

std::vector<std::string> DockerEngineClient::ListContainers(const std::string& label) {
    const json filters = {{"label", {label}}};
    auto response = Send("GET", "/containers/json?all=1&filters=" + UrlEncode(filters.dump()));
    if (!response.Ok()) {
        ThrowApiError("Container list", response);
    }

    std::vector<std::string> ids;
    auto body = json::parse(response.body, nullptr, false);
    if (body.is_array()) {
        for (const auto& entry : body) {
            if (entry.is_object() && entry.contains("Id") && entry["Id"].is_string()) {
                ids.push_back(entry["Id"].get<std::string>());
            }
        }
    }
    return ids;
}

std::optional<double> DockerEngineClient::GetMemoryUsageMb(const std::string& container_id) {
    auto response = Send("GET", "/containers/" + PathSegment(container_id) + "/stats?stream=false");
    if (!response.Ok()) {
        ThrowApiError("Container stats", response);
    }

    auto body = json::parse(response.body, nullptr, false);
    if (!body.is_object() || !body.contains("memory_stats") || !body["memory_stats"].is_object()) {
        return std::nullopt;
    }
    const auto& memory = body["memory_stats"];
    // max_usage exists on cgroup v1 only
    for (const char* key : {"max_usage", "usage"}) {
        if (memory.contains(key) && memory[key].is_number() && memory[key].get<double>() > 0) {
            return memory[key].get<double>() / (1024.0 * 1024.0);
        }
    }
    return std::nullopt;
}

// ============================================================================
// CONTAINER BUILDER
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithTmpfsSize(std::size_t mb) {
    config_.tmpfs_size_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithStorageLimit(std::size_t mb) {
    config_.storage_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(const std::string& mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key, const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithReadOnlyRootfs(bool read_only) {
    config_.read_only_rootfs = read_only;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace codebox
