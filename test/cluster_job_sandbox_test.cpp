#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "codebox/backends/cluster_job_sandbox.hpp"
#include "utils.h"

#include <filesystem>
#include <fstream>
#include <map>

using namespace codebox;
using backends::ClusterJobSandbox;
using core::ResourceLimits;
using core::ResourceLimitsBuilder;
using core::SandboxError;
using core::SandboxErrorKind;
using nlohmann::json;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

const std::string kJobs = "/apis/batch/v1/namespaces/sandbox/jobs";
const std::string kPolicies = "/apis/networking.k8s.io/v1/namespaces/sandbox/networkpolicies";
const std::string kPods = "/api/v1/namespaces/sandbox/pods";

json Pod(const json& state) {
  return json{{"metadata", {{"name", "code-exec-pod"}}},
              {"status", {{"phase", "Running"},
                          {"containerStatuses", json::array({{{"name", "executor"}, {"state", state}}})}}}};
}

json PodList(const json& pod) {
  return json{{"kind", "PodList"}, {"items", json::array({pod})}};
}

json Terminated(int exit_code, const std::string& reason) {
  return json{{"terminated", {{"exitCode", exit_code}, {"reason", reason}}}};
}

// API server that accepts every write and reports `job_status` and `pod`
void ScriptCluster(FakeTransport& transport, const json& job_status, const json& pod, const std::string& log) {
  transport.On("GET", "/api/v1/namespaces/sandbox", 200, R"({"metadata":{"name":"sandbox"}})");
  transport.On("POST", kJobs, 201, R"({"metadata":{"name":"job","uid":"uid-1234"}})");
  transport.On("GET", kJobs + "/", 200, json{{"status", job_status}}.dump());
  transport.On("DELETE", kJobs + "/", 200, "{}");
  transport.On("POST", kPolicies, 201, "{}");
  transport.On("PATCH", kPolicies + "/", 200, "{}");
  transport.On("DELETE", kPolicies + "/", 200, "{}");
  transport.On("GET", kPods + "?", 200, PodList(pod).dump());
  transport.On("GET", kPods + "/", 200, log);
}

std::size_t IndexOf(const std::vector<utils::HttpRequest>& requests, const std::string& method,
                    const std::string& prefix) {
  for (std::size_t i = 0; i < requests.size(); ++i) {
    if (requests[i].method == method && requests[i].path.rfind(prefix, 0) == 0) return i;
  }
  return requests.size();
}

} // namespace

class ClusterJobSandboxTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<FakeTransport>();
    config_.job_namespace = "sandbox";
    config_.supervision = FastSupervision();
  }

  std::shared_ptr<ClusterJobSandbox> MakeSandbox() {
    return std::make_shared<ClusterJobSandbox>(config_, transport_);
  }

  std::shared_ptr<FakeTransport> transport_;
  ClusterJobSandbox::Config config_;
};

TEST_F(ClusterJobSandboxTest, SuccessfulRunIsolatesBeforeStarting) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "42\n");
  const auto result = MakeSandbox()->Execute("print(42)", ResourceLimits());

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.stdout_output, "42\n");
  EXPECT_TRUE(result.stderr_output.empty());

  const auto requests = transport_->Requests();
  const auto policy = IndexOf(requests, "POST", kPolicies);
  const auto create = IndexOf(requests, "POST", kJobs);
  const auto owner = IndexOf(requests, "PATCH", kPolicies + "/");
  ASSERT_LT(owner, requests.size());
  EXPECT_LT(policy, create);
  EXPECT_LT(create, owner);

  EXPECT_FALSE(json::parse(requests[create].body)["spec"].contains("suspend"));
  EXPECT_FALSE(json::parse(requests[policy].body)["metadata"].contains("ownerReferences"));
  EXPECT_EQ(requests[owner].path, kPolicies + "/" + json::parse(requests[create].body)["metadata"]["name"].get<std::string>() + "-deny-egress");
  EXPECT_EQ(requests[owner].content_type, "application/merge-patch+json");
  EXPECT_EQ(json::parse(requests[owner].body)["metadata"]["ownerReferences"][0]["uid"], "uid-1234");

  EXPECT_EQ(transport_->Count("DELETE", kPolicies + "/"), 1);
  auto removal = transport_->Last("DELETE", kJobs + "/");
  ASSERT_TRUE(removal.has_value());
  EXPECT_THAT(removal->path, HasSubstr("?propagationPolicy=Background"));

  auto pods = transport_->Last("GET", kPods + "?");
  ASSERT_TRUE(pods.has_value());
  EXPECT_THAT(pods->path, HasSubstr("labelSelector=codebox.invocation%3Dcode-exec-"));
  auto log = transport_->Last("GET", kPods + "/");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->path, kPods + "/code-exec-pod/log?container=executor");
}

TEST_F(ClusterJobSandboxTest, FailedRunReportsLogAsStderr) {
  ScriptCluster(*transport_, {{"failed", 1}}, Pod(Terminated(1, "Error")), "Traceback: boom\n");
  const auto result = MakeSandbox()->Execute("raise RuntimeError('boom')", ResourceLimits());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stderr_output, "Traceback: boom\n");
  EXPECT_TRUE(result.stdout_output.empty());
}

TEST_F(ClusterJobSandboxTest, OomKilledContainer) {
  ScriptCluster(*transport_, {{"failed", 1}}, Pod(Terminated(137, "OOMKilled")), "");
  const auto result = MakeSandbox()->Execute("x = ' ' * 10**10", ResourceLimits::Testing());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "Process killed: memory limit of 256 MB exceeded");
}

TEST_F(ClusterJobSandboxTest, ActiveDeadlineCountsAsTimeout) {
  const json status = {{"failed", 1},
                       {"conditions", json::array({{{"type", "Failed"}, {"status", "True"}, {"reason", "DeadlineExceeded"}}})}};
  ScriptCluster(*transport_, status, Pod(Terminated(137, "Error")), "partial");
  const auto result = MakeSandbox()->Execute("while True: pass", ResourceLimits());
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, core::kTimeoutExitCode);
}

TEST_F(ClusterJobSandboxTest, LocalDeadlineDeletesJob) {
  ScriptCluster(*transport_, {{"active", 1}}, Pod(json{{"running", json::object()}}), "");
  const auto result = MakeSandbox()->Execute("while True: pass", ResourceLimitsBuilder().WithTimeout(1).Build());
  EXPECT_TRUE(result.timed_out);
  // Once to terminate, once during teardown
  EXPECT_EQ(transport_->Count("DELETE", kJobs + "/"), 2);
}

TEST_F(ClusterJobSandboxTest, ImagePullFailureIsStartFailure) {
  ScriptCluster(*transport_, {{"active", 1}},
                Pod(json{{"waiting", {{"reason", "ErrImagePull"}, {"message", "not found"}}}}), "");
  try {
    MakeSandbox()->Execute("print(1)", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::UNIT_START_FAILED);
    EXPECT_THAT(e.what(), HasSubstr("ErrImagePull"));
  }
  EXPECT_EQ(transport_->Count("DELETE", kJobs + "/"), 1);
}

TEST_F(ClusterJobSandboxTest, UnrestrictedNetworkSkipsPolicy) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  MakeSandbox()->Execute("print('ok')", ResourceLimits::Development());
  EXPECT_EQ(transport_->Count("POST", kPolicies), 0);
}

TEST_F(ClusterJobSandboxTest, PolicyFailureNeverCreatesJob) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  transport_->On("POST", kPolicies, 422, R"({"kind":"Status","reason":"Invalid","message":"bad selector"})");
  try {
    MakeSandbox()->Execute("print('ok')", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::UNIT_CREATE_FAILED);
    EXPECT_THAT(e.what(), HasSubstr("bad selector"));
  }
  EXPECT_EQ(transport_->Count("POST", kJobs), 0);
  EXPECT_EQ(transport_->Count("DELETE", kJobs + "/"), 0);
}

TEST_F(ClusterJobSandboxTest, JobFailureRemovesPolicy) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  transport_->On("POST", kJobs, 422, R"({"kind":"Status","reason":"Invalid","message":"bad job"})");
  try {
    MakeSandbox()->Execute("print('ok')", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::UNIT_CREATE_FAILED);
    EXPECT_THAT(e.what(), HasSubstr("bad job"));
  }
  EXPECT_EQ(transport_->Count("DELETE", kPolicies + "/"), 1);
  EXPECT_EQ(transport_->Count("PATCH", kPolicies + "/"), 0);
}

TEST_F(ClusterJobSandboxTest, LeftoverPolicyIsTeardownFailure) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  transport_->On("POST", kJobs, 422, R"({"kind":"Status","reason":"Invalid","message":"bad job"})");
  transport_->On("DELETE", kPolicies + "/", 500, R"({"kind":"Status","reason":"InternalError","message":"etcd down"})");
  try {
    MakeSandbox()->Execute("print('ok')", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::TEARDOWN_FAILED);
    EXPECT_THAT(e.what(), HasSubstr("bad job"));
    EXPECT_THAT(e.what(), HasSubstr("etcd down"));
    EXPECT_THAT(e.UnitId(), StartsWith("code-exec-"));
  }
}

TEST_F(ClusterJobSandboxTest, OwnerPatchFailureStillRuns) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  transport_->On("PATCH", kPolicies + "/", 500, R"({"kind":"Status","reason":"InternalError"})");
  const auto result = MakeSandbox()->Execute("print('ok')", ResourceLimits());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(transport_->Count("DELETE", kPolicies + "/"), 1);
}

TEST_F(ClusterJobSandboxTest, MissingNamespaceIsConfigurationError) {
  transport_->On("GET", "/api/v1/namespaces/sandbox", 404, R"({"kind":"Status","reason":"NotFound"})");
  try {
    MakeSandbox()->CheckReady();
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::CONFIGURATION);
    EXPECT_THAT(e.what(), HasSubstr("'sandbox' does not exist"));
  }
}

TEST_F(ClusterJobSandboxTest, ForbiddenIsConfigurationError) {
  ScriptCluster(*transport_, {{"succeeded", 1}}, Pod(Terminated(0, "Completed")), "ok");
  transport_->On("POST", kJobs, 403,
                 R"({"kind":"Status","reason":"Forbidden","message":"jobs.batch is forbidden"})");
  try {
    MakeSandbox()->Execute("print(1)", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::CONFIGURATION);
    EXPECT_THAT(e.what(), HasSubstr("forbidden"));
  }
}

TEST_F(ClusterJobSandboxTest, UnreachableApiServer) {
  transport_->Fail("GET", "/api/v1/namespaces/sandbox");
  try {
    MakeSandbox()->CheckReady();
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::ENGINE_UNREACHABLE);
    EXPECT_EQ(e.Backend(), "cluster-job");
  }
}

TEST_F(ClusterJobSandboxTest, JobManifest) {
  config_.job_ttl_seconds = 120;
  const auto limits = ResourceLimitsBuilder()
                          .WithTimeout(45)
                          .WithMemoryLimit(256)
                          .WithCpuQuota(0.5)
                          .WithDiskQuota(50)
                          .Build();
  const auto job = MakeSandbox()->BuildJobManifest("print(1)", limits, "code-exec-test");

  EXPECT_EQ(job["kind"], "Job");
  EXPECT_EQ(job["metadata"]["name"], "code-exec-test");
  EXPECT_EQ(job["metadata"]["labels"]["codebox.invocation"], "code-exec-test");
  const auto& spec = job["spec"];
  EXPECT_FALSE(spec.contains("suspend"));
  EXPECT_EQ(spec["backoffLimit"], 0);
  EXPECT_EQ(spec["ttlSecondsAfterFinished"], 120);
  EXPECT_EQ(spec["activeDeadlineSeconds"], 45);

  const auto& pod = spec["template"]["spec"];
  EXPECT_EQ(pod["restartPolicy"], "Never");
  EXPECT_FALSE(pod["automountServiceAccountToken"].get<bool>());
  EXPECT_TRUE(pod["securityContext"]["runAsNonRoot"].get<bool>());

  const auto& container = pod["containers"][0];
  EXPECT_EQ(container["name"], "executor");
  EXPECT_EQ(container["command"], json::array({"python", "-c", "print(1)"}));
  EXPECT_EQ(container["resources"]["limits"]["cpu"], "500m");
  EXPECT_EQ(container["resources"]["limits"]["memory"], "256Mi");
  EXPECT_EQ(container["resources"]["limits"]["ephemeral-storage"], "50Mi");
  EXPECT_EQ(container["resources"]["requests"], container["resources"]["limits"]);
  EXPECT_FALSE(container["securityContext"]["allowPrivilegeEscalation"].get<bool>());
  EXPECT_TRUE(container["securityContext"]["readOnlyRootFilesystem"].get<bool>());
  EXPECT_EQ(container["securityContext"]["capabilities"]["drop"], json::array({"ALL"}));
  EXPECT_EQ(pod["volumes"][0]["emptyDir"]["sizeLimit"], "50Mi");
}

TEST_F(ClusterJobSandboxTest, NetworkPolicyDeniesAllTraffic) {
  const auto policy = MakeSandbox()->BuildNetworkPolicy("code-exec-test");
  EXPECT_EQ(policy["metadata"]["name"], "code-exec-test-deny-egress");
  EXPECT_FALSE(policy["metadata"].contains("ownerReferences"));
  EXPECT_EQ(policy["spec"]["podSelector"]["matchLabels"]["codebox.invocation"], "code-exec-test");
  EXPECT_EQ(policy["spec"]["policyTypes"], json::array({"Ingress", "Egress"}));
  EXPECT_TRUE(policy["spec"]["egress"].empty());
}

TEST(ClusterJobPolicyTest, OwnerPatchNamesTheJob) {
  const auto patch = ClusterJobSandbox::BuildPolicyOwnerPatch("code-exec-test", "uid-9");
  const auto& owner = patch["metadata"]["ownerReferences"][0];
  EXPECT_EQ(owner["apiVersion"], "batch/v1");
  EXPECT_EQ(owner["kind"], "Job");
  EXPECT_EQ(owner["name"], "code-exec-test");
  EXPECT_EQ(owner["uid"], "uid-9");
}

TEST(ClusterJobNameTest, GeneratedNamesAreDnsLabels) {
  const auto first = ClusterJobSandbox::GenerateJobName("print(1)");
  const auto second = ClusterJobSandbox::GenerateJobName("print(1)");
  EXPECT_THAT(first, StartsWith("code-exec-"));
  EXPECT_LE(first.size(), 63u);
  EXPECT_NE(first, second);
  for (char c : first) {
    EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-') << first;
  }
}

TEST(ClusterStatusTest, ParseJobStatus) {
  const auto status = utils::ParseJobStatus(json{
      {"status", {{"failed", 1},
                  {"conditions", json::array({{{"type", "Failed"}, {"status", "True"}, {"reason", "BackoffLimitExceeded"}}})}}}});
  EXPECT_EQ(status.failed, 1);
  EXPECT_FALSE(status.deadline_exceeded);
  EXPECT_EQ(status.failure_reason, "BackoffLimitExceeded");
  EXPECT_TRUE(status.Finished());
  EXPECT_FALSE(utils::ParseJobStatus(json::object()).Finished());
}

TEST(ClusterStatusTest, ParsePodStatusPicksExecutorContainer) {
  json pod = Pod(Terminated(3, "Error"));
  pod["status"]["containerStatuses"].push_back({{"name", "sidecar"}, {"state", Terminated(0, "Completed")}});
  const auto status = utils::ParsePodStatus(pod, "executor");
  EXPECT_EQ(status.name, "code-exec-pod");
  ASSERT_TRUE(status.exit_code.has_value());
  EXPECT_EQ(*status.exit_code, 3);
  EXPECT_EQ(status.terminated_reason, "Error");
  EXPECT_TRUE(utils::IsFatalWaitingReason("ImagePullBackOff"));
  EXPECT_FALSE(utils::IsFatalWaitingReason("ContainerCreating"));
}

class ClusterCredentialsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("codebox-sa-" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    std::filesystem::create_directories(dir_);
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  void Write(const std::string& name, const std::string& contents) {
    std::ofstream(dir_ / name) << contents;
  }

  std::filesystem::path dir_;
};

TEST_F(ClusterCredentialsTest, InClusterReadsServiceAccount) {
  Write("token", "secret-token\n");
  Write("ca.crt", "-----BEGIN CERTIFICATE-----\n");
  Write("namespace", "jobs\n");
  const std::map<std::string, std::string> env{{"KUBERNETES_SERVICE_HOST", "10.0.0.1"},
                                               {"KUBERNETES_SERVICE_PORT", "443"}};
  const auto credentials = utils::ClusterCredentials::InCluster(
      [&env](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) return std::nullopt;
        return it->second;
      },
      dir_.string());
  EXPECT_EQ(credentials.api_server, "https://10.0.0.1:443");
  EXPECT_EQ(credentials.token, "secret-token");
  EXPECT_EQ(credentials.ca_file, (dir_ / "ca.crt").string());
  EXPECT_EQ(credentials.default_namespace, "jobs");

  const auto transport = credentials.ToTransportConfig();
  EXPECT_EQ(transport.bearer_token, "secret-token");
  EXPECT_TRUE(transport.verify_tls);
}

TEST_F(ClusterCredentialsTest, InClusterNeedsServiceEnvironment) {
  EXPECT_THROW(utils::ClusterCredentials::InCluster(
                   [](const std::string&) -> std::optional<std::string> { return std::nullopt; },
                   dir_.string()),
               utils::ClusterConfigError);
}

TEST_F(ClusterCredentialsTest, ExternalValidation) {
  EXPECT_THROW(utils::ClusterCredentials::External("", "t", "", "", "", "", false), utils::ClusterConfigError);
  EXPECT_THROW(utils::ClusterCredentials::External("https://k8s:6443", "", "", "", "", "", false),
               utils::ClusterConfigError);
  EXPECT_THROW(utils::ClusterCredentials::External("https://k8s:6443", "", "", "", "cert.pem", "", false),
               utils::ClusterConfigError);
  EXPECT_THROW(utils::ClusterCredentials::External("https://k8s:6443", "t", "", "/nonexistent/ca.crt", "", "", false),
               utils::ClusterConfigError);

  Write("token", " file-token \n");
  const auto credentials = utils::ClusterCredentials::External(
      "https://k8s:6443/", "", (dir_ / "token").string(), "", "", "", true);
  EXPECT_EQ(credentials.api_server, "https://k8s:6443");
  EXPECT_EQ(credentials.token, "file-token");
  EXPECT_FALSE(credentials.ToTransportConfig().verify_tls);
}

TEST(KubernetesClientTest, ApiErrorCarriesStatusAndReason) {
  auto transport = std::make_shared<FakeTransport>();
  transport->On("POST", kJobs, 409,
                R"({"kind":"Status","reason":"AlreadyExists","message":"jobs \"x\" already exists"})");
  utils::KubernetesClient client(transport);
  try {
    client.CreateJob("sandbox", json{{"metadata", {{"name", "x"}}}});
    FAIL() << "expected KubernetesApiError";
  } catch (const utils::KubernetesApiError& e) {
    EXPECT_EQ(e.Status(), 409);
    EXPECT_EQ(e.Reason(), "AlreadyExists");
    EXPECT_STREQ(e.what(), "Job create failed (HTTP 409, AlreadyExists): jobs \"x\" already exists");
  }
}

TEST(KubernetesClientTest, NamespaceLookup) {
  auto transport = std::make_shared<FakeTransport>();
  transport->On("GET", "/api/v1/namespaces/present", 200, R"({"kind":"Namespace"})");
  transport->On("GET", "/api/v1/namespaces/hidden", 403, R"({"reason":"Forbidden"})");
  utils::KubernetesClient client(transport);
  EXPECT_TRUE(client.NamespaceExists("present"));
  EXPECT_TRUE(client.NamespaceExists("hidden"));
  EXPECT_FALSE(client.NamespaceExists("absent"));
}
