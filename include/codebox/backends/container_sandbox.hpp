/**
 * @file container_sandbox.hpp
 * @brief Sandbox backend running each execution in a Docker container
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/sandbox.hpp"
#include "codebox/utils/container_utils.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace codebox {
namespace backends {

/**
 * @class ContainerSandbox
 * @brief One hardened, throwaway container per execution
 *
 * Limits map onto the container as:
 * - memory: Memory and MemorySwap (no swap)
 * - cpu: NanoCpus
 * - processes: PidsLimit
 * - disk: size of the /tmp and /var/tmp tmpfs mounts, plus StorageOpt when enabled
 * - network: `none` -> none, `unrestricted` -> bridge; `allowlist` has no
 *   engine-native form and falls back to none
 *
 * The container runs `python -c <code>` as uid 65534 with a read-only root
 * filesystem, no capabilities and no-new-privileges. Nothing from the host
 * is mounted.
 *
 * **Usage Example**:
 * @code
 * ContainerSandbox::Config config;
 * config.image = "python:3.12-slim";
 * auto sandbox = ContainerSandbox::Create(config);
 * auto result = sandbox->Execute("print(2 + 2)", ResourceLimits::Testing());
 * @endcode
 */
class ContainerSandbox : public core::Sandbox {
public:
    static constexpr const char* kBackendName = "container-engine";

    /**
     * @struct Config
     * @brief Container backend configuration
     */
    struct Config {
        std::string image{"python:3.12-slim"};              ///< Base image with a python interpreter
        std::string socket_path{"/var/run/docker.sock"};    ///< Docker daemon socket
        bool use_storage_opt{false};                        ///< Set StorageOpt size (overlay2 on xfs with pquota)
        bool pull_missing_image{true};                      ///< Pull the image on first use if absent
        core::SupervisionOptions supervision;               ///< Poll and teardown timing
    };

    ContainerSandbox(const Config& config, std::shared_ptr<utils::HttpTransport> transport);

    /// Sandbox connected to the configured daemon socket
    static std::shared_ptr<ContainerSandbox> Create(const Config& config);

    std::string Name() const override { return kBackendName; }

    /**
     * @brief Translate code and limits into a container specification
     * @param code Python source, passed as an argv element
     * @param limits Resource limits
     * @param name Container name
     */
    utils::ContainerConfig BuildContainerConfig(const std::string& code,
                                                const core::ResourceLimits& limits,
                                                const std::string& name) const;

    const Config& GetConfig() const { return config_; }

protected:
    void EnsureReady() override;
    std::string CreateUnit(const std::string& code, const core::ResourceLimits& limits) override;
    void StartUnit(const std::string& unit_id) override;
    core::UnitStatus PollUnit(const std::string& unit_id) override;
    void TerminateUnit(const std::string& unit_id) override;
    core::UnitOutput CollectOutput(const std::string& unit_id, const core::UnitStatus& status) override;
    void DestroyUnit(const std::string& unit_id) override;

private:
    template <typename Fn>
    auto Call(core::SandboxErrorKind kind, const std::string& unit_id, Fn&& fn) -> decltype(fn());

    Config config_;
    utils::DockerEngineClient client_;
    std::atomic<bool> ready_{false};
};

} // namespace backends
} // namespace codebox
