/**
 * @file container_sandbox.cpp
 * @brief Docker container backend
 *
 * **Container Lifecycle**:
 * 1. Ping the daemon and make sure the image is present (once)
 * 2. `POST /containers/create?name=codebox-<ts>-<rand>`
 * 3. `POST /containers/{id}/start`
 * 4. Poll `GET /containers/{id}/json` until exited
 * 5. On deadline or cancellation: kill with SIGKILL
 * 6. Fetch and demultiplex logs
 * 7. `DELETE /containers/{id}?force=1&v=1`
 *
 * @date 2025
 */

#include "codebox/backends/container_sandbox.hpp"
#include "codebox/utils/hash_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace codebox {
namespace backends {

using core::SandboxError;
using core::SandboxErrorKind;

ContainerSandbox::ContainerSandbox(const Config& config,
                                   std::shared_ptr<utils::HttpTransport> transport)
    : core::Sandbox(config.supervision)
    , config_(config)
    , client_(std::move(transport)) {
    spdlog::debug("Container sandbox using {} with image {}", client_.Endpoint(), config_.image);
}

std::shared_ptr<ContainerSandbox> ContainerSandbox::Create(const Config& config) {
    return std::make_shared<ContainerSandbox>(
        config, utils::DockerEngineClient::UnixSocketTransport(config.socket_path));
}

// Maps client failures onto the sandbox error taxonomy
template <typename Fn>
auto ContainerSandbox::Call(SandboxErrorKind kind, const std::string& unit_id, Fn&& fn)
    -> decltype(fn()) {
    try {
        return fn();
    }
    catch (const utils::TransportError& e) {
        throw SandboxError(SandboxErrorKind::ENGINE_UNREACHABLE, Name(),
                           fmt::format("Docker engine unreachable at {}: {}", client_.Endpoint(), e.what()),
                           unit_id);
    }
    catch (const utils::DockerApiError& e) {
        throw SandboxError(kind, Name(), e.what(), unit_id);
    }
    catch (const nlohmann::json::exception& e) {
        throw SandboxError(kind, Name(),
                           fmt::format("Malformed Docker Engine response: {}", e.what()), unit_id);
    }
}

// ============================================================================
// CONTAINER SPECIFICATION
// ============================================================================

utils::ContainerConfig ContainerSandbox::BuildContainerConfig(const std::string& code,
                                                              const core::ResourceLimits& limits,
                                                              const std::string& name) const {
    std::string network = "none";
    switch (limits.GetNetworkMode()) {
        case core::NetworkMode::NONE:
            break;
        case core::NetworkMode::ALLOWLIST:
            spdlog::warn("Network allowlist ({} domains) is not enforceable by the container engine; "
                         "running without network", limits.AllowedDomains().size());
            break;
        case core::NetworkMode::UNRESTRICTED:
            network = "bridge";
            break;
    }

    utils::ContainerBuilder builder;
    builder.WithName(name)
        .WithImage(config_.image)
        .WithCommand({"python", "-c", code})
        .WithUser("65534:65534")
        .WithWorkingDir("/tmp")
        .WithMemoryLimit(static_cast<std::size_t>(limits.MemoryLimitMb()))
        .WithCPULimit(limits.CpuQuota())
        .WithPidsLimit(limits.MaxProcesses())
        .WithTmpfsSize(static_cast<std::size_t>(limits.DiskQuotaMb()))
        .WithNetwork(network)
        .WithEnvironment("PYTHONDONTWRITEBYTECODE", "1")
        .WithEnvironment("PYTHONUNBUFFERED", "1")
        .WithEnvironment("HOME", "/tmp")
        .WithLabel("codebox.managed", "true")
        .WithLabel("codebox.invocation", name)
        .WithReadOnlyRootfs(true)
        .DropAllCapabilities();
    if (config_.use_storage_opt) {
        builder.WithStorageLimit(static_cast<std::size_t>(limits.DiskQuotaMb()));
    }
    return builder.Build();
}

// ============================================================================
// LIFECYCLE HOOKS
// ============================================================================

void ContainerSandbox::EnsureReady() {
    if (ready_.load()) {
        return;
    }

    const bool alive = Call(SandboxErrorKind::ENGINE_UNREACHABLE, "", [&] { return client_.Ping(); });
    if (!alive) {
        throw SandboxError(SandboxErrorKind::ENGINE_UNREACHABLE, Name(),
                           fmt::format("Docker engine at {} did not answer ping", client_.Endpoint()));
    }

    const bool present = Call(SandboxErrorKind::IMAGE_UNAVAILABLE, "",
                              [&] { return client_.ImageExists(config_.image); });
    if (!present) {
        if (!config_.pull_missing_image) {
            throw SandboxError(SandboxErrorKind::IMAGE_UNAVAILABLE, Name(),
                               fmt::format("Image {} is not present and pulling is disabled", config_.image));
        }
        Call(SandboxErrorKind::IMAGE_UNAVAILABLE, "", [&] { client_.PullImage(config_.image); });
    }

    ready_.store(true);
    spdlog::info("Docker engine ready at {} (image {})", client_.Endpoint(), config_.image);
}

std::string ContainerSandbox::CreateUnit(const std::string& code, const core::ResourceLimits& limits) {
    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string name = fmt::format("codebox-{}-{}", timestamp, utils::HashUtils::RandomHex(8));

    const auto container = BuildContainerConfig(code, limits, name);
    const std::string id = Call(SandboxErrorKind::UNIT_CREATE_FAILED, "",
                                [&] { return client_.CreateContainer(container); });
    spdlog::debug("Created container {} ({})", name, id.substr(0, 12));
    return id;
}

void ContainerSandbox::StartUnit(const std::string& unit_id) {
    Call(SandboxErrorKind::UNIT_START_FAILED, unit_id, [&] { client_.StartContainer(unit_id); });
}

core::UnitStatus ContainerSandbox::PollUnit(const std::string& unit_id) {
    const auto info = Call(SandboxErrorKind::UNIT_MONITOR_FAILED, unit_id,
                           [&] { return client_.InspectContainer(unit_id); });

    core::UnitStatus status;
    status.finished = info.state == utils::ContainerState::EXITED ||
                      info.state == utils::ContainerState::DEAD;
    status.exit_code = info.exit_code;
    status.oom_killed = info.oom_killed;
    if (status.finished && !info.error.empty()) {
        spdlog::warn("Container {} reported: {}", unit_id.substr(0, 12), info.error);
    }
    return status;
}

void ContainerSandbox::TerminateUnit(const std::string& unit_id) {
    const bool killed = Call(SandboxErrorKind::UNIT_MONITOR_FAILED, unit_id,
                             [&] { return client_.KillContainer(unit_id); });
    if (!killed) {
        spdlog::debug("Container {} had already stopped", unit_id.substr(0, 12));
    }
}

core::UnitOutput ContainerSandbox::CollectOutput(const std::string& unit_id,
                                                 const core::UnitStatus& /*status*/) {
    const auto logs = Call(SandboxErrorKind::OUTPUT_COLLECTION_FAILED, unit_id,
                           [&] { return client_.GetContainerLogs(unit_id); });

    core::UnitOutput output;
    output.stdout_output = logs.stdout_output;
    output.stderr_output = logs.stderr_output;
    if (logs.truncated) {
        spdlog::debug("Log stream of container {} exceeded the response cap", unit_id.substr(0, 12));
    }

    try {
        output.memory_used_mb = client_.GetMemoryUsageMb(unit_id);
    }
    catch (const std::exception& e) {
        spdlog::debug("Memory statistics unavailable for {}: {}", unit_id.substr(0, 12), e.what());
    }
    return output;
}

void ContainerSandbox::DestroyUnit(const std::string& unit_id) {
    const bool removed = Call(SandboxErrorKind::TEARDOWN_FAILED, unit_id,
                              [&] { return client_.RemoveContainer(unit_id); });
    if (!removed) {
        spdlog::debug("Container {} was already removed", unit_id.substr(0, 12));
    }
}

} // namespace backends
} // namespace codebox
