/**
 * @file container_utils.hpp
 * @brief Docker Engine API client and hardened container configuration
 *
 * Talks to the Docker daemon over its REST API (normally the local unix
 * socket) through an HttpTransport. Covers the container lifecycle the
 * sandbox needs: ping, image inspect/pull, create, start, inspect, kill,
 * logs, stats and remove.
 *
 * @date 2025
 */

#pragma once

#include "codebox/utils/http_transport.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by State.Status
 */
enum class ContainerState {
    CREATED,      ///< Created but not started
    RUNNING,      ///< Running
    PAUSED,       ///< Paused
    RESTARTING,   ///< Restarting
    REMOVING,     ///< Being removed
    EXITED,       ///< Exited
    DEAD,         ///< Dead (failed removal or daemon error)
    UNKNOWN       ///< Unrecognized status
};

ContainerState ParseContainerState(const std::string& status);

/**
 * @class DockerApiError
 * @brief Non-success HTTP status from the Docker Engine API
 */
class DockerApiError : public std::runtime_error {
public:
    DockerApiError(long status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    long Status() const { return status_; }

private:
    long status_;
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 *
 * Defaults describe the hardened sandbox profile: non-root user, read-only
 * root filesystem, all capabilities dropped, no new privileges, no network.
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                               ///< Container name
    std::string image{"python:3.12-slim"};          ///< Base image
    std::vector<std::string> command;               ///< Cmd argv (no shell)
    std::string user{"65534:65534"};                ///< Run as nobody:nogroup
    std::string working_dir{"/tmp"};                ///< Working directory

    // Resource Limits
    std::size_t memory_limit_mb{512};               ///< Memory limit, swap disabled
    double cpu_limit{1.0};                          ///< CPU cores (NanoCpus)
    int pids_limit{1};                              ///< Process limit
    std::size_t tmpfs_size_mb{100};                 ///< Size of each tmpfs mount
    std::vector<std::string> tmpfs_paths{"/tmp", "/var/tmp"};   ///< Writable scratch mounts
    std::optional<std::size_t> storage_limit_mb;    ///< StorageOpt size (driver support required)

    // Network Settings
    std::string network_mode{"none"};               ///< "none" or "bridge"

    // Security Settings
    bool privileged{false};                         ///< Never set for sandboxes
    bool read_only_rootfs{true};                    ///< Read-only root filesystem
    std::vector<std::string> capabilities_drop{"ALL"};             ///< Dropped capabilities
    std::vector<std::string> security_opts{"no-new-privileges"};   ///< SecurityOpt entries

    // Environment
    std::map<std::string, std::string> environment_vars;   ///< Environment variables
    std::map<std::string, std::string> labels;             ///< Container labels

    /**
     * @brief Request body for POST /containers/create
     */
    nlohmann::json ToCreateBody() const;
};

/**
 * @struct ContainerInfo
 * @brief Subset of GET /containers/{id}/json
 */
struct ContainerInfo {
    std::string id;                                 ///< Container ID
    std::string name;                               ///< Container name
    ContainerState state{ContainerState::UNKNOWN};  ///< Current state
    int exit_code{0};                               ///< Exit code (when exited)
    bool oom_killed{false};                         ///< Killed by the OOM killer
    std::string error;                              ///< Daemon-reported start error
};

/**
 * @struct ContainerLogs
 * @brief Demultiplexed container output
 */
struct ContainerLogs {
    std::string stdout_output;
    std::string stderr_output;
    bool truncated{false};   ///< Log body hit the transport's size cap
};

/**
 * @brief Split a Docker multiplexed log stream into stdout and stderr
 *
 * Each frame is an 8-byte header (stream type, 3 padding bytes, big-endian
 * payload length) followed by the payload. Streams that do not start with a
 * valid header (TTY containers) are returned as stdout. A frame cut short by
 * the response cap contributes its available bytes.
 */
ContainerLogs DemultiplexLogs(const std::string& raw);

/**
 * @brief Split "repo[:tag]" into the fromImage/tag pair used by the pull API
 *
 * Registry ports ("host:5000/img") and digests ("img@sha256:...") are kept
 * in the repository part.
 */
std::pair<std::string, std::string> SplitImageReference(const std::string& image);

/**
 * @class DockerEngineClient
 * @brief Docker Engine REST API client
 *
 * Stateless apart from the transport, so one instance can serve concurrent
 * sandbox invocations.
 *
 * Error reporting:
 * - connection failures surface as TransportError
 * - unexpected HTTP statuses surface as DockerApiError
 * - "not found" on kill/remove is reported through the return value
 *
 * **Usage Example**:
 * @code
 * DockerEngineClient client(std::make_shared<CurlTransport>(transport_config));
 * auto config = ContainerBuilder()
 *     .WithImage("python:3.12-slim")
 *     .WithCommand({"python", "-c", "print(1)"})
 *     .WithMemoryLimit(256)
 *     .Build();
 * auto id = client.CreateContainer(config);
 * client.StartContainer(id);
 * @endcode
 */
class DockerEngineClient {
public:
    explicit DockerEngineClient(std::shared_ptr<HttpTransport> transport);

    /**
     * @brief Build a transport for a local daemon socket
     * @param socket_path Path to the Docker unix socket
     */
    static std::shared_ptr<HttpTransport> UnixSocketTransport(const std::string& socket_path);

    /// GET /_ping
    bool Ping();

    bool ImageExists(const std::string& image);

    /**
     * @brief Pull an image (POST /images/create)
     * @throws DockerApiError on HTTP failure or an error in the progress stream
     */
    void PullImage(const std::string& image);

    /**
     * @brief Create a container
     * @return Container ID
     */
    std::string CreateContainer(const ContainerConfig& config);

    void StartContainer(const std::string& container_id);

    ContainerInfo InspectContainer(const std::string& container_id);

    /**
     * @brief Send SIGKILL
     * @return false if the container was not running or no longer exists
     */
    bool KillContainer(const std::string& container_id);

    /**
     * @brief Force-remove a container and its anonymous volumes
     * @return false if the container did not exist
     */
    bool RemoveContainer(const std::string& container_id);

    ContainerLogs GetContainerLogs(const std::string& container_id);

    /**
     * @brief IDs of all containers, running or not, carrying a label
     * @param label "key" or "key=value"
     */
    std::vector<std::string> ListContainers(const std::string& label);

    /**
     * @brief Peak (or current) memory usage from a one-shot stats sample
     * @return Memory in MB, or nullopt when the daemon reports none
     */
    std::optional<double> GetMemoryUsageMb(const std::string& container_id);

    std::string Endpoint() const { return transport_->Endpoint(); }

private:
    HttpResponse Send(const std::string& method, const std::string& path,
                      const std::string& body = "");
    [[noreturn]] void ThrowApiError(const std::string& action, const HttpResponse& response) const;

    std::shared_ptr<HttpTransport> transport_;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithUser(const std::string& user);
    ContainerBuilder& WithWorkingDir(const std::string& dir);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithTmpfsSize(std::size_t mb);
    ContainerBuilder& WithStorageLimit(std::size_t mb);
    ContainerBuilder& WithNetwork(const std::string& mode);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& WithReadOnlyRootfs(bool read_only = true);
    ContainerBuilder& DropAllCapabilities();

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace codebox
