/**
 * @file cluster_utils.hpp
 * @brief Kubernetes API client, credentials and status parsing
 *
 * Minimal typed access to the resources the cluster backend manages: batch
 * Jobs, their Pods and pod logs, and per-job NetworkPolicies. Requests go
 * through an HttpTransport authenticated with a bearer token or a client
 * certificate.
 *
 * @date 2025
 */

#pragma once

#include "codebox/utils/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @class ClusterConfigError
 * @brief Credentials or connection settings are missing or unreadable
 */
class ClusterConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class KubernetesApiError
 * @brief Non-success status from the API server
 *
 * Carries the HTTP status and the `reason` of the returned Status object
 * ("NotFound", "Forbidden", "AlreadyExists", ...).
 */
class KubernetesApiError : public std::runtime_error {
public:
    KubernetesApiError(long status, std::string reason, const std::string& message)
        : std::runtime_error(message), status_(status), reason_(std::move(reason)) {}

    long Status() const { return status_; }
    const std::string& Reason() const { return reason_; }

private:
    long status_;
    std::string reason_;
};

/// Environment lookup used for in-cluster discovery; injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by std::getenv
std::optional<std::string> ProcessEnvironment(const std::string& name);

/**
 * @struct ClusterCredentials
 * @brief How to reach and authenticate against the API server
 */
struct ClusterCredentials {
    static constexpr const char* kServiceAccountDir = "/var/run/secrets/kubernetes.io/serviceaccount";

    std::string api_server;               ///< https://host:port
    std::string token;                    ///< Bearer token (may be empty with client certs)
    std::string ca_file;                  ///< CA bundle for the API server
    std::string client_cert_file;         ///< Client certificate (mTLS)
    std::string client_key_file;          ///< Client private key (mTLS)
    bool insecure_skip_tls_verify{false}; ///< Skip verification (development clusters)
    std::string default_namespace;        ///< Namespace of the service account, if known

    /**
     * @brief Credentials of the pod's service account
     *
     * Reads KUBERNETES_SERVICE_HOST/KUBERNETES_SERVICE_PORT and the token, CA
     * and namespace files under `service_account_dir`.
     *
     * @throws ClusterConfigError when not running inside a cluster
     */
    static ClusterCredentials InCluster(const EnvLookup& env = ProcessEnvironment,
                                        const std::string& service_account_dir = kServiceAccountDir);

    /**
     * @brief Credentials for an external API server
     *
     * `token_file` is read when `token` is empty.
     *
     * @throws ClusterConfigError if the server is missing, no authentication
     *         is given, or a file cannot be read
     */
    static ClusterCredentials External(const std::string& api_server,
                                       const std::string& token,
                                       const std::string& token_file,
                                       const std::string& ca_file,
                                       const std::string& client_cert_file,
                                       const std::string& client_key_file,
                                       bool insecure_skip_tls_verify);

    CurlTransportConfig ToTransportConfig() const;
};

/**
 * @struct JobStatus
 * @brief Terminal-state view of a batch Job
 */
struct JobStatus {
    int active{0};
    int succeeded{0};
    int failed{0};
    bool deadline_exceeded{false};   ///< DeadlineExceeded condition present
    std::string failure_reason;      ///< Reason of the Failed condition

    bool Finished() const { return succeeded > 0 || failed > 0 || deadline_exceeded; }
};

JobStatus ParseJobStatus(const nlohmann::json& job);

/**
 * @struct PodStatus
 * @brief State of the executor container in a job's pod
 */
struct PodStatus {
    std::string name;                    ///< Pod name
    std::string phase;                   ///< Pending, Running, Succeeded, Failed, Unknown
    std::optional<int> exit_code;        ///< Set once the container terminated
    std::string terminated_reason;       ///< "Completed", "Error", "OOMKilled", ...
    std::string waiting_reason;          ///< "ContainerCreating", "ErrImagePull", ...
    std::string waiting_message;         ///< Detail for waiting_reason
};

/**
 * @brief Extract the state of `container` from a Pod object
 */
PodStatus ParsePodStatus(const nlohmann::json& pod, const std::string& container);

/**
 * @brief True for waiting reasons that never resolve on their own
 *
 * ErrImagePull, ImagePullBackOff, InvalidImageName and
 * CreateContainerConfigError.
 */
bool IsFatalWaitingReason(const std::string& reason);

/**
 * @class KubernetesClient
 * @brief Kubernetes REST API client for jobs, pods and network policies
 *
 * Error reporting:
 * - connection failures surface as TransportError
 * - unexpected statuses surface as KubernetesApiError
 * - "not found" on delete is reported through the return value
 */
class KubernetesClient {
public:
    explicit KubernetesClient(std::shared_ptr<HttpTransport> transport);

    /**
     * @brief Check that a namespace exists
     *
     * A 403 is treated as present: job creation rights do not imply the
     * right to read namespaces.
     */
    bool NamespaceExists(const std::string& ns);

    /// Create a Job; returns the created object (with metadata.uid)
    nlohmann::json CreateJob(const std::string& ns, const nlohmann::json& job);

    nlohmann::json GetJob(const std::string& ns, const std::string& name);

    /// Delete with propagationPolicy=Background; false if not found
    bool DeleteJob(const std::string& ns, const std::string& name);

    nlohmann::json CreateNetworkPolicy(const std::string& ns, const nlohmann::json& policy);

    /// JSON merge patch of a NetworkPolicy
    void PatchNetworkPolicy(const std::string& ns, const std::string& name, const nlohmann::json& patch);

    /// False if not found
    bool DeleteNetworkPolicy(const std::string& ns, const std::string& name);

    /// Pods matching a label selector (items of the PodList)
    std::vector<nlohmann::json> ListPods(const std::string& ns, const std::string& label_selector);

    /// Plain-text log of one container
    std::string GetPodLog(const std::string& ns, const std::string& pod, const std::string& container);

    std::string Endpoint() const { return transport_->Endpoint(); }

private:
    HttpResponse Send(const std::string& method, const std::string& path,
                      const std::string& body = "",
                      const std::string& content_type = "application/json");
    [[noreturn]] void ThrowApiError(const std::string& action, const HttpResponse& response) const;

    std::shared_ptr<HttpTransport> transport_;
};

} // namespace utils
} // namespace codebox
