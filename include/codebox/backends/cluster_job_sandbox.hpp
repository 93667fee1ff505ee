/**
 * @file cluster_job_sandbox.hpp
 * @brief Sandbox backend running each execution as a Kubernetes Job
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/sandbox.hpp"
#include "codebox/utils/cluster_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace codebox {
namespace backends {

/**
 * @class ClusterJobSandbox
 * @brief One single-pod batch Job per execution
 *
 * The deny-all NetworkPolicy (if any) is created before the job and selects
 * its pod by label, so the pod never runs before egress is denied. Once the
 * job exists it becomes the policy's owner, and the cluster removes both.
 * The pod runs as uid 1000 with a RuntimeDefault seccomp profile, a
 * read-only root filesystem and an emptyDir /tmp capped at the disk quota.
 * `activeDeadlineSeconds` mirrors the timeout as a cluster-side backstop, and
 * `ttlSecondsAfterFinished` garbage-collects jobs a crashed host never removed.
 *
 * The pod log merges stdout and stderr: output is reported as stdout for a
 * zero exit code and as stderr otherwise.
 */
class ClusterJobSandbox : public core::Sandbox {
public:
    static constexpr const char* kBackendName = "cluster-job";
    static constexpr const char* kContainerName = "executor";

    /**
     * @struct Config
     * @brief Cluster backend configuration
     */
    struct Config {
        std::string image{"python:3.12-slim"};     ///< Executor image
        std::string job_namespace{"default"};      ///< Namespace for jobs and policies
        int job_ttl_seconds{300};                  ///< ttlSecondsAfterFinished
        bool create_network_policy{true};          ///< Deny egress unless unrestricted
        core::SupervisionOptions supervision{std::chrono::milliseconds(1000)};  ///< Poll and teardown timing
    };

    ClusterJobSandbox(const Config& config, std::shared_ptr<utils::HttpTransport> transport);

    /// Sandbox connected to the API server described by `credentials`
    static std::shared_ptr<ClusterJobSandbox> Create(const Config& config,
                                                     const utils::ClusterCredentials& credentials);

    std::string Name() const override { return kBackendName; }

    /**
     * @brief Job name "code-exec-<unix ts>-<sha256(code)[:8]>-<4 random hex>"
     */
    static std::string GenerateJobName(const std::string& code);

    /// Job manifest
    nlohmann::json BuildJobManifest(const std::string& code, const core::ResourceLimits& limits,
                                    const std::string& name) const;

    /// Deny-all NetworkPolicy selecting the job's pod by its invocation label
    nlohmann::json BuildNetworkPolicy(const std::string& job_name) const;

    /// Merge patch making the job the owner of its NetworkPolicy
    static nlohmann::json BuildPolicyOwnerPatch(const std::string& job_name, const std::string& job_uid);

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

    std::optional<utils::PodStatus> FindPod(const std::string& unit_id);

    Config config_;
    utils::KubernetesClient client_;
    std::atomic<bool> ready_{false};
};

} // namespace backends
} // namespace codebox
