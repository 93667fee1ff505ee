/**
 * @file cluster_utils.cpp
 * @brief Kubernetes API client implementation
 *
 * **API Paths Used**:
 * - `/api/v1/namespaces/{ns}`
 * - `/apis/batch/v1/namespaces/{ns}/jobs[/{name}]`
 * - `/api/v1/namespaces/{ns}/pods?labelSelector=...`
 * - `/api/v1/namespaces/{ns}/pods/{pod}/log?container=...`
 * - `/apis/networking.k8s.io/v1/namespaces/{ns}/networkpolicies[/{name}]`
 *
 * @date 2025
 */

#include "codebox/utils/cluster_utils.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace codebox {
namespace utils {

using json = nlohmann::json;

namespace {

std::string ReadFile(const std::filesystem::path& path, const std::string& what) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ClusterConfigError(fmt::format("Cannot read {} from {}", what, path.string()));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::string NamespacePath(const std::string& group_version, const std::string& ns,
                          const std::string& resource) {
    return fmt::format("{}/namespaces/{}/{}", group_version, UrlEncode(ns), resource);
}

constexpr const char* kCoreV1 = "/api/v1";
constexpr const char* kBatchV1 = "/apis/batch/v1";
constexpr const char* kNetworkingV1 = "/apis/networking.k8s.io/v1";

} // anonymous namespace

std::optional<std::string> ProcessEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ============================================================================
// CREDENTIALS
// ============================================================================

ClusterCredentials ClusterCredentials::InCluster(const EnvLookup& env,
                                                 const std::string& service_account_dir) {
    const auto host = env("KUBERNETES_SERVICE_HOST");
    const auto port = env("KUBERNETES_SERVICE_PORT");
    if (!host || host->empty() || !port || port->empty()) {
        throw ClusterConfigError(
            "Not running inside a cluster: KUBERNETES_SERVICE_HOST and KUBERNETES_SERVICE_PORT must be set");
    }

    const std::filesystem::path dir(service_account_dir);
    ClusterCredentials credentials;
    const bool ipv6 = host->find(':') != std::string::npos;
    credentials.api_server = ipv6 ? fmt::format("https://[{}]:{}", *host, *port)
                                  : fmt::format("https://{}:{}", *host, *port);
    credentials.token = StringUtils::Trim(ReadFile(dir / "token", "service account token"));
    if (std::filesystem::exists(dir / "ca.crt")) {
        credentials.ca_file = (dir / "ca.crt").string();
    }
    if (std::filesystem::exists(dir / "namespace")) {
        credentials.default_namespace = StringUtils::Trim(ReadFile(dir / "namespace", "namespace"));
    }
    spdlog::debug("Using in-cluster credentials for {}", credentials.api_server);
    return credentials;
}

ClusterCredentials ClusterCredentials::External(const std::string& api_server,
                                                const std::string& token,
                                                const std::string& token_file,
                                                const std::string& ca_file,
                                                const std::string& client_cert_file,
                                                const std::string& client_key_file,
                                                bool insecure_skip_tls_verify) {
    if (StringUtils::IsBlank(api_server)) {
        throw ClusterConfigError("An API server URL is required outside the cluster");
    }
    if (client_cert_file.empty() != client_key_file.empty()) {
        throw ClusterConfigError("Client certificate and client key must be given together");
    }

    ClusterCredentials credentials;
    credentials.api_server = StringUtils::Trim(api_server);
    while (StringUtils::EndsWith(credentials.api_server, "/")) {
        credentials.api_server.pop_back();
    }
    credentials.token = StringUtils::Trim(token);
    if (credentials.token.empty() && !token_file.empty()) {
        credentials.token = StringUtils::Trim(ReadFile(token_file, "token"));
    }
    credentials.ca_file = ca_file;
    credentials.client_cert_file = client_cert_file;
    credentials.client_key_file = client_key_file;
    credentials.insecure_skip_tls_verify = insecure_skip_tls_verify;

    if (credentials.token.empty() && credentials.client_cert_file.empty()) {
        throw ClusterConfigError("No cluster authentication configured: set a token, token file or client certificate");
    }
    for (const auto& file : {ca_file, client_cert_file, client_key_file}) {
        if (!file.empty() && !std::filesystem::exists(file)) {
            throw ClusterConfigError(fmt::format("Credential file {} does not exist", file));
        }
    }
    if (insecure_skip_tls_verify) {
        spdlog::warn("TLS verification of {} is disabled", credentials.api_server);
    }
    return credentials;
}

CurlTransportConfig ClusterCredentials::ToTransportConfig() const {
    CurlTransportConfig config;
    config.base_url = api_server;
    config.bearer_token = token;
    config.ca_file = ca_file;
    config.client_cert_file = client_cert_file;
    config.client_key_file = client_key_file;
    config.verify_tls = !insecure_skip_tls_verify;
    return config;
}

// ============================================================================
// STATUS PARSING
// ============================================================================

JobStatus ParseJobStatus(const json& job) {
    JobStatus status;
    if (!job.contains("status") || !job["status"].is_object()) {
        return status;
    }
    const auto& s = job["status"];
    status.active = s.value("active", 0);
    status.succeeded = s.value("succeeded", 0);
    status.failed = s.value("failed", 0);

    if (s.contains("conditions") && s["conditions"].is_array()) {
        for (const auto& condition : s["conditions"]) {
            if (condition.value("status", "") != "True") {
                continue;
            }
            const std::string reason = condition.value("reason", "");
            if (reason == "DeadlineExceeded") {
                status.deadline_exceeded = true;
            }
            if (condition.value("type", "") == "Failed") {
                status.failure_reason = reason;
            }
        }
    }
    return status;
}

PodStatus ParsePodStatus(const json& pod, const std::string& container) {
    PodStatus status;
    if (pod.contains("metadata") && pod["metadata"].is_object()) {
        status.name = pod["metadata"].value("name", "");
    }
    if (!pod.contains("status") || !pod["status"].is_object()) {
        return status;
    }
    const auto& s = pod["status"];
    status.phase = s.value("phase", "");

    if (!s.contains("containerStatuses") || !s["containerStatuses"].is_array()) {
        return status;
    }
    for (const auto& cs : s["containerStatuses"]) {
        if (cs.value("name", "") != container || !cs.contains("state")) {
            continue;
        }
        const auto& state = cs["state"];
        if (state.contains("terminated") && state["terminated"].is_object()) {
            status.exit_code = state["terminated"].value("exitCode", 0);
            status.terminated_reason = state["terminated"].value("reason", "");
        } else if (state.contains("waiting") && state["waiting"].is_object()) {
            status.waiting_reason = state["waiting"].value("reason", "");
            status.waiting_message = state["waiting"].value("message", "");
        }
    }
    return status;
}

bool IsFatalWaitingReason(const std::string& reason) {
    static const std::set<std::string> fatal{
        "ErrImagePull", "ImagePullBackOff", "InvalidImageName", "CreateContainerConfigError"
    };
    return fatal.count(reason) > 0;
}

// ============================================================================
// KUBERNETES CLIENT
// ============================================================================

KubernetesClient::KubernetesClient(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

HttpResponse KubernetesClient::Send(const std::string& method, const std::string& path,
                                    const std::string& body, const std::string& content_type) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    request.content_type = content_type;
    return transport_->Send(request);
}

void KubernetesClient::ThrowApiError(const std::string& action, const HttpResponse& response) const {
    std::string reason;
    std::string message = StringUtils::Abbreviate(StringUtils::Trim(response.body), 200);
    auto status = json::parse(response.body, nullptr, false);
    if (status.is_object()) {
        reason = status.value("reason", "");
        message = status.value("message", message);
    }
    throw KubernetesApiError(response.status, reason,
                             fmt::format("{} failed (HTTP {}{}): {}", action, response.status,
                                         reason.empty() ? "" : ", " + reason, message));
}

bool KubernetesClient::NamespaceExists(const std::string& ns) {
    auto response = Send("GET", fmt::format("{}/namespaces/{}", kCoreV1, UrlEncode(ns)));
    if (response.status == 404) {
        return false;
    }
    if (response.status == 403) {
        spdlog::debug("Not allowed to read namespace {}; assuming it exists", ns);
        return true;
    }
    if (!response.Ok()) {
        ThrowApiError("Namespace lookup", response);
    }
    return true;
}

json KubernetesClient::CreateJob(const std::string& ns, const json& job) {
    auto response = Send("POST", NamespacePath(kBatchV1, ns, "jobs"), job.dump());
    if (!response.Ok()) {
        ThrowApiError("Job create", response);
    }
    return json::parse(response.body);
}

json KubernetesClient::GetJob(const std::string& ns, const std::string& name) {
    auto response = Send("GET", NamespacePath(kBatchV1, ns, "jobs/" + UrlEncode(name)));
    if (!response.Ok()) {
        ThrowApiError("Job read", response);
    }
    return json::parse(response.body);
}

bool KubernetesClient::DeleteJob(const std::string& ns, const std::string& name) {
    const json options = {
        {"kind", "DeleteOptions"},
        {"apiVersion", "v1"},
        {"propagationPolicy", "Background"}
    };
    auto response = Send("DELETE",
                         NamespacePath(kBatchV1, ns, "jobs/" + UrlEncode(name)) + "?propagationPolicy=Background",
                         options.dump());
    if (response.status == 404) {
        return false;
    }
    if (!response.Ok()) {
        ThrowApiError("Job delete", response);
    }
    return true;
}

json KubernetesClient::CreateNetworkPolicy(const std::string& ns, const json& policy) {
    auto response = Send("POST", NamespacePath(kNetworkingV1, ns, "networkpolicies"), policy.dump());
    if (!response.Ok()) {
        ThrowApiError("NetworkPolicy create", response);
    }
    return json::parse(response.body);
}

void KubernetesClient::PatchNetworkPolicy(const std::string& ns, const std::string& name,
                                          const json& patch) {
    auto response = Send("PATCH", NamespacePath(kNetworkingV1, ns, "networkpolicies/" + UrlEncode(name)),
                         patch.dump(), "application/merge-patch+json");
    if (!response.Ok()) {
        ThrowApiError("NetworkPolicy patch", response);
    }
}

bool KubernetesClient::DeleteNetworkPolicy(const std::string& ns, const std::string& name) {
    auto response = Send("DELETE", NamespacePath(kNetworkingV1, ns, "networkpolicies/" + UrlEncode(name)));
    if (response.status == 404) {
        return false;
    }
    if (!response.Ok()) {
        ThrowApiError("NetworkPolicy delete", response);
    }
    return true;
}

std::vector<json> KubernetesClient::ListPods(const std::string& ns, const std::string& label_selector) {
    auto response = Send("GET", NamespacePath(kCoreV1, ns, "pods") + "?labelSelector=" + UrlEncode(label_selector));
    if (!response.Ok()) {
        ThrowApiError("Pod list", response);
    }
    auto list = json::parse(response.body);
    std::vector<json> pods;
    if (list.contains("items") && list["items"].is_array()) {
        for (const auto& item : list["items"]) {
            pods.push_back(item);
        }
    }
    return pods;
}

std::string KubernetesClient::GetPodLog(const std::string& ns, const std::string& pod,
                                        const std::string& container) {
    auto response = Send("GET", NamespacePath(kCoreV1, ns, "pods/" + UrlEncode(pod)) +
                                    "/log?container=" + UrlEncode(container));
    if (!response.Ok()) {
        ThrowApiError("Pod log read", response);
    }
    return response.body;
}

} // namespace utils
} // namespace codebox
