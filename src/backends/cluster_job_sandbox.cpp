/**
 * @file cluster_job_sandbox.cpp
 * @brief Kubernetes Job backend
 *
 * **Job Lifecycle**:
 * 1. Verify the namespace (once)
 * 2. Create the deny-egress NetworkPolicy, then the Job
 * 3. Make the Job the owner of the NetworkPolicy
 * 4. Poll the Job status and its pod's executor container
 * 5. On deadline or cancellation: delete the Job (pods go with it)
 * 6. Read the pod log
 * 7. Delete the NetworkPolicy and the Job (propagationPolicy=Background)
 *
 * @date 2025
 */

#include "codebox/backends/cluster_job_sandbox.hpp"
#include "codebox/utils/hash_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>

namespace codebox {
namespace backends {

using core::SandboxError;
using core::SandboxErrorKind;
using json = nlohmann::json;

namespace {

constexpr const char* kAppLabel = "codebox-exec";
constexpr const char* kInvocationLabel = "codebox.invocation";

std::string PolicyName(const std::string& job_name) {
    return job_name + "-deny-egress";
}

std::string Selector(const std::string& job_name) {
    return std::string(kInvocationLabel) + "=" + job_name;
}

json Labels(const std::string& job_name) {
    return {
        {"app", kAppLabel},
        {"app.kubernetes.io/managed-by", "codebox"},
        {kInvocationLabel, job_name}
    };
}

} // anonymous namespace

ClusterJobSandbox::ClusterJobSandbox(const Config& config,
                                     std::shared_ptr<utils::HttpTransport> transport)
    : core::Sandbox(config.supervision)
    , config_(config)
    , client_(std::move(transport)) {
    spdlog::debug("Cluster sandbox using {} namespace {}", client_.Endpoint(), config_.job_namespace);
}

std::shared_ptr<ClusterJobSandbox> ClusterJobSandbox::Create(const Config& config,
                                                             const utils::ClusterCredentials& credentials) {
    return std::make_shared<ClusterJobSandbox>(
        config, std::make_shared<utils::CurlTransport>(credentials.ToTransportConfig()));
}

template <typename Fn>
auto ClusterJobSandbox::Call(SandboxErrorKind kind, const std::string& unit_id, Fn&& fn)
    -> decltype(fn()) {
    try {
        return fn();
    }
    catch (const utils::TransportError& e) {
        throw SandboxError(SandboxErrorKind::ENGINE_UNREACHABLE, Name(),
                           fmt::format("Kubernetes API server unreachable at {}: {}",
                                       client_.Endpoint(), e.what()),
                           unit_id);
    }
    catch (const utils::KubernetesApiError& e) {
        // RBAC problems are configuration, not transient failures
        const bool denied = e.Status() == 401 || e.Status() == 403;
        throw SandboxError(denied ? SandboxErrorKind::CONFIGURATION : kind, Name(), e.what(), unit_id);
    }
    catch (const nlohmann::json::exception& e) {
        throw SandboxError(kind, Name(),
                           fmt::format("Malformed Kubernetes API response: {}", e.what()), unit_id);
    }
}

// ============================================================================
// MANIFESTS
// ============================================================================

std::string ClusterJobSandbox::GenerateJobName(const std::string& code) {
    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("code-exec-{}-{}-{}", timestamp,
                       utils::HashUtils::ShortDigest(code, 8),
                       utils::HashUtils::RandomHex(4));
}

json ClusterJobSandbox::BuildJobManifest(const std::string& code, const core::ResourceLimits& limits,
                                         const std::string& name) const {
    const auto millicores = static_cast<long>(std::lround(limits.CpuQuota() * 1000.0));
    const std::string cpu = fmt::format("{}m", millicores);
    const std::string memory = fmt::format("{}Mi", limits.MemoryLimitMb());
    const std::string storage = fmt::format("{}Mi", limits.DiskQuotaMb());
    const json resources = {
        {"cpu", cpu},
        {"memory", memory},
        {"ephemeral-storage", storage}
    };

    json container = {
        {"name", kContainerName},
        {"image", config_.image},
        {"command", {"python", "-c", code}},
        {"workingDir", "/tmp"},
        {"env", json::array({
            {{"name", "PYTHONDONTWRITEBYTECODE"}, {"value", "1"}},
            {{"name", "PYTHONUNBUFFERED"}, {"value", "1"}},
            {{"name", "HOME"}, {"value", "/tmp"}}
        })},
        {"resources", {{"requests", resources}, {"limits", resources}}},
        {"securityContext", {
            {"allowPrivilegeEscalation", false},
            {"readOnlyRootFilesystem", true},
            {"runAsNonRoot", true},
            {"privileged", false},
            {"capabilities", {{"drop", {"ALL"}}}}
        }},
        {"volumeMounts", json::array({{{"name", "tmp"}, {"mountPath", "/tmp"}}})}
    };

    json pod_spec = {
        {"restartPolicy", "Never"},
        {"automountServiceAccountToken", false},
        {"enableServiceLinks", false},
        {"securityContext", {
            {"runAsNonRoot", true},
            {"runAsUser", 1000},
            {"runAsGroup", 1000},
            {"fsGroup", 1000},
            {"seccompProfile", {{"type", "RuntimeDefault"}}}
        }},
        {"containers", json::array({container})},
        {"volumes", json::array({
            {{"name", "tmp"}, {"emptyDir", {{"sizeLimit", storage}}}}
        })}
    };

    // No pod-level pids field; the kubelet's podPidsLimit applies
    spdlog::debug("Job {}: process limit {} left to the node's pod PID limit",
                  name, limits.MaxProcesses());

    return json{
        {"apiVersion", "batch/v1"},
        {"kind", "Job"},
        {"metadata", {{"name", name}, {"labels", Labels(name)}}},
        {"spec", {
            {"backoffLimit", 0},
            {"ttlSecondsAfterFinished", config_.job_ttl_seconds},
            {"activeDeadlineSeconds", limits.TimeoutSeconds()},
            {"template", {
                {"metadata", {{"labels", Labels(name)}}},
                {"spec", pod_spec}
            }}
        }}
    };
}

json ClusterJobSandbox::BuildNetworkPolicy(const std::string& job_name) const {
    return json{
        {"apiVersion", "networking.k8s.io/v1"},
        {"kind", "NetworkPolicy"},
        {"metadata", {
            {"name", PolicyName(job_name)},
            {"labels", Labels(job_name)}
        }},
        {"spec", {
            {"podSelector", {{"matchLabels", {{kInvocationLabel, job_name}}}}},
            {"policyTypes", json::array({"Ingress", "Egress"})},
            {"ingress", json::array()},
            {"egress", json::array()}
        }}
    };
}

json ClusterJobSandbox::BuildPolicyOwnerPatch(const std::string& job_name, const std::string& job_uid) {
    return json{
        {"metadata", {
            {"ownerReferences", json::array({{
                {"apiVersion", "batch/v1"},
                {"kind", "Job"},
                {"name", job_name},
                {"uid", job_uid},
                {"blockOwnerDeletion", false}
            }})}
        }}
    };
}

// ============================================================================
// LIFECYCLE HOOKS
// ============================================================================

void ClusterJobSandbox::EnsureReady() {
    if (ready_.load()) {
        return;
    }
    const bool exists = Call(SandboxErrorKind::CONFIGURATION, "",
                             [&] { return client_.NamespaceExists(config_.job_namespace); });
    if (!exists) {
        throw SandboxError(SandboxErrorKind::CONFIGURATION, Name(),
                           fmt::format("Namespace '{}' does not exist on {}",
                                       config_.job_namespace, client_.Endpoint()));
    }
    ready_.store(true);
    spdlog::info("Kubernetes API ready at {} (namespace {}, image {})",
                 client_.Endpoint(), config_.job_namespace, config_.image);
}

std::string ClusterJobSandbox::CreateUnit(const std::string& code, const core::ResourceLimits& limits) {
    const std::string name = GenerateJobName(code);
    const auto manifest = BuildJobManifest(code, limits, name);

    bool isolate = limits.GetNetworkMode() != core::NetworkMode::UNRESTRICTED;
    if (limits.GetNetworkMode() == core::NetworkMode::ALLOWLIST) {
        spdlog::warn("Network allowlist ({} domains) cannot be expressed as a NetworkPolicy; "
                     "denying all egress for {}", limits.AllowedDomains().size(), name);
    }
    if (isolate && !config_.create_network_policy) {
        spdlog::warn("NetworkPolicy creation disabled: egress of job {} is not restricted", name);
        isolate = false;
    }

    if (isolate) {
        const auto policy = BuildNetworkPolicy(name);
        Call(SandboxErrorKind::UNIT_CREATE_FAILED, "",
             [&] { return client_.CreateNetworkPolicy(config_.job_namespace, policy); });
    }

    json created;
    try {
        created = Call(SandboxErrorKind::UNIT_CREATE_FAILED, "",
                       [&] { return client_.CreateJob(config_.job_namespace, manifest); });
    }
    catch (const SandboxError& e) {
        if (isolate) {
            try {
                Call(SandboxErrorKind::TEARDOWN_FAILED, name,
                     [&] { return client_.DeleteNetworkPolicy(config_.job_namespace, PolicyName(name)); });
            }
            catch (const SandboxError& cleanup_error) {
                throw SandboxError(SandboxErrorKind::TEARDOWN_FAILED, Name(),
                                   fmt::format("NetworkPolicy {} left behind after job creation failed ({}): {}",
                                               PolicyName(name), e.what(), cleanup_error.what()),
                                   name);
            }
        }
        throw;
    }

    if (isolate) {
        const auto uid = created.contains("metadata") && created["metadata"].contains("uid")
                             ? created["metadata"]["uid"].get<std::string>()
                             : std::string();
        if (uid.empty()) {
            spdlog::warn("Job {} returned no uid; its NetworkPolicy is removed only at teardown", name);
        } else {
            try {
                Call(SandboxErrorKind::UNIT_CREATE_FAILED, name, [&] {
                    client_.PatchNetworkPolicy(config_.job_namespace, PolicyName(name),
                                               BuildPolicyOwnerPatch(name, uid));
                });
            }
            catch (const SandboxError& e) {
                spdlog::warn("NetworkPolicy of job {} has no owner and is removed only at teardown: {}",
                             name, e.what());
            }
        }
    }
    return name;
}

void ClusterJobSandbox::StartUnit(const std::string& unit_id) {
    // The job controller starts the pod as soon as the job exists
    spdlog::debug("Job {} created in namespace {}", unit_id, config_.job_namespace);
}

std::optional<utils::PodStatus> ClusterJobSandbox::FindPod(const std::string& unit_id) {
    const auto pods = Call(SandboxErrorKind::UNIT_MONITOR_FAILED, unit_id,
                           [&] { return client_.ListPods(config_.job_namespace, Selector(unit_id)); });
    if (pods.empty()) {
        return std::nullopt;
    }
    return utils::ParsePodStatus(pods.front(), kContainerName);
}

core::UnitStatus ClusterJobSandbox::PollUnit(const std::string& unit_id) {
    const json job = Call(SandboxErrorKind::UNIT_MONITOR_FAILED, unit_id,
                          [&] { return client_.GetJob(config_.job_namespace, unit_id); });
    const auto job_status = utils::ParseJobStatus(job);
    const auto pod = FindPod(unit_id);

    if (pod && utils::IsFatalWaitingReason(pod->waiting_reason)) {
        throw SandboxError(SandboxErrorKind::UNIT_START_FAILED, Name(),
                           fmt::format("Pod {} cannot start: {} {}", pod->name,
                                       pod->waiting_reason, pod->waiting_message),
                           unit_id);
    }

    core::UnitStatus status;
    if (job_status.deadline_exceeded) {
        status.finished = true;
        status.deadline_exceeded = true;
        return status;
    }

    const bool container_done = pod && pod->exit_code.has_value();
    if (job_status.succeeded > 0 || job_status.failed > 0 || container_done) {
        status.finished = true;
        if (container_done) {
            status.exit_code = *pod->exit_code;
            status.oom_killed = pod->terminated_reason == "OOMKilled";
        } else {
            status.exit_code = job_status.succeeded > 0 ? 0 : 1;
        }
    }
    return status;
}

void ClusterJobSandbox::TerminateUnit(const std::string& unit_id) {
    const bool deleted = Call(SandboxErrorKind::UNIT_MONITOR_FAILED, unit_id,
                              [&] { return client_.DeleteJob(config_.job_namespace, unit_id); });
    if (!deleted) {
        spdlog::debug("Job {} was already gone at termination", unit_id);
    }
}

core::UnitOutput ClusterJobSandbox::CollectOutput(const std::string& unit_id, const core::UnitStatus& status) {
    core::UnitOutput output;
    const auto pod = FindPod(unit_id);
    if (!pod || pod->name.empty()) {
        spdlog::warn("Job {} has no pod to read output from", unit_id);
        return output;
    }

    const std::string log = Call(SandboxErrorKind::OUTPUT_COLLECTION_FAILED, unit_id, [&] {
        return client_.GetPodLog(config_.job_namespace, pod->name, kContainerName);
    });
    if (status.exit_code == 0) {
        output.stdout_output = log;
    } else {
        output.stderr_output = log;
    }
    return output;
}

void ClusterJobSandbox::DestroyUnit(const std::string& unit_id) {
    if (config_.create_network_policy) {
        Call(SandboxErrorKind::TEARDOWN_FAILED, unit_id,
             [&] { return client_.DeleteNetworkPolicy(config_.job_namespace, PolicyName(unit_id)); });
    }
    const bool deleted = Call(SandboxErrorKind::TEARDOWN_FAILED, unit_id,
                              [&] { return client_.DeleteJob(config_.job_namespace, unit_id); });
    if (!deleted) {
        spdlog::debug("Job {} was already deleted", unit_id);
    }
}

} // namespace backends
} // namespace codebox
