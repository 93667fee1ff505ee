#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "codebox/backends/container_sandbox.hpp"
#include "utils.h"

using namespace codebox;
using backends::ContainerSandbox;
using core::ResourceLimits;
using core::ResourceLimitsBuilder;
using core::SandboxError;
using core::SandboxErrorKind;
using nlohmann::json;
using ::testing::HasSubstr;

class ContainerSandboxTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<FakeTransport>();
    config_.supervision = FastSupervision();
  }

  std::shared_ptr<ContainerSandbox> MakeSandbox() {
    return std::make_shared<ContainerSandbox>(config_, transport_);
  }

  json CreateBody() const {
    auto request = transport_->Last("POST", "/containers/create");
    EXPECT_TRUE(request.has_value());
    return request ? json::parse(request->body) : json::object();
  }

  std::shared_ptr<FakeTransport> transport_;
  ContainerSandbox::Config config_;
};

TEST_F(ContainerSandboxTest, SuccessfulRun) {
  ScriptDockerRun(*transport_, "abc123", 0, "hello\n", "note\n");
  const auto result = MakeSandbox()->Execute("print('hello')", ResourceLimits());

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_output, "hello\n");
  EXPECT_EQ(result.stderr_output, "note\n");
  ASSERT_TRUE(result.memory_used_mb.has_value());
  EXPECT_DOUBLE_EQ(*result.memory_used_mb, 10.0);

  EXPECT_EQ(transport_->Count("POST", "/containers/abc123/start"), 1);
  EXPECT_EQ(transport_->Count("POST", "/containers/abc123/kill"), 0);
  auto removal = transport_->Last("DELETE", "/containers/abc123");
  ASSERT_TRUE(removal.has_value());
  EXPECT_EQ(removal->path, "/containers/abc123?force=1&v=1");
}

TEST_F(ContainerSandboxTest, CreateBodyCarriesLimitsAndHardening) {
  ScriptDockerRun(*transport_, "abc123", 0, "", "");
  const auto limits = ResourceLimitsBuilder()
                          .WithMemoryLimit(256)
                          .WithCpuQuota(0.5)
                          .WithDiskQuota(50)
                          .WithMaxProcesses(4)
                          .Build();
  MakeSandbox()->Execute("print(1)", limits);

  const auto body = CreateBody();
  EXPECT_EQ(body["Image"], "python:3.12-slim");
  EXPECT_EQ(body["Cmd"], json::array({"python", "-c", "print(1)"}));
  EXPECT_EQ(body["User"], "65534:65534");
  EXPECT_EQ(body["WorkingDir"], "/tmp");
  EXPECT_TRUE(body["NetworkDisabled"].get<bool>());
  EXPECT_THAT(body["Env"].get<std::vector<std::string>>(), ::testing::Contains("PYTHONUNBUFFERED=1"));
  EXPECT_EQ(body["Labels"]["codebox.managed"], "true");

  const auto& host = body["HostConfig"];
  EXPECT_EQ(host["Memory"], 256LL * 1024 * 1024);
  EXPECT_EQ(host["MemorySwap"], host["Memory"]);
  EXPECT_EQ(host["NanoCpus"], 500000000LL);
  EXPECT_EQ(host["PidsLimit"], 4);
  EXPECT_TRUE(host["ReadonlyRootfs"].get<bool>());
  EXPECT_FALSE(host["Privileged"].get<bool>());
  EXPECT_EQ(host["CapDrop"], json::array({"ALL"}));
  EXPECT_EQ(host["NetworkMode"], "none");
  EXPECT_EQ(host["Tmpfs"]["/tmp"], "rw,noexec,nosuid,size=50m,mode=1777");
  EXPECT_FALSE(host.contains("StorageOpt"));

  auto create = transport_->Last("POST", "/containers/create");
  ASSERT_TRUE(create.has_value());
  EXPECT_THAT(create->path, HasSubstr("?name=codebox-"));
}

TEST_F(ContainerSandboxTest, StorageOptWhenEnabled) {
  config_.use_storage_opt = true;
  const auto body = MakeSandbox()->BuildContainerConfig("pass", ResourceLimits(), "n").ToCreateBody();
  EXPECT_EQ(body["HostConfig"]["StorageOpt"]["size"], "100M");
}

TEST_F(ContainerSandboxTest, NetworkModes) {
  auto sandbox = MakeSandbox();
  const auto open = sandbox->BuildContainerConfig(
      "pass", ResourceLimits::Development(), "n").ToCreateBody();
  EXPECT_EQ(open["HostConfig"]["NetworkMode"], "bridge");
  EXPECT_FALSE(open["NetworkDisabled"].get<bool>());

  // Domain allowlists cannot be enforced here, so the container gets no network
  const auto allowlist = sandbox->BuildContainerConfig(
      "pass", ResourceLimitsBuilder(ResourceLimits::Production()).AllowDomain("pypi.org").Build(), "n").ToCreateBody();
  EXPECT_EQ(allowlist["HostConfig"]["NetworkMode"], "none");
}

TEST_F(ContainerSandboxTest, NonZeroExit) {
  ScriptDockerRun(*transport_, "abc123", 1, "", "Traceback (most recent call last)\n");
  const auto result = MakeSandbox()->Execute("raise ValueError()", ResourceLimits());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_THAT(result.stderr_output, HasSubstr("Traceback"));
  EXPECT_EQ(transport_->Count("DELETE", "/containers/abc123"), 1);
}

TEST_F(ContainerSandboxTest, OomKill) {
  ScriptDockerRun(*transport_, "abc123", 137, "", "");
  transport_->On("GET", "/containers/abc123/json", 200,
                 R"({"State":{"Status":"exited","ExitCode":137,"OOMKilled":true}})");
  const auto result = MakeSandbox()->Execute("x = ' ' * 10**10", ResourceLimits());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "Process killed: memory limit of 512 MB exceeded");
}

TEST_F(ContainerSandboxTest, TimeoutKillsAndRemoves) {
  ScriptDockerHang(*transport_, "abc123");
  const auto result = MakeSandbox()->Execute("while True: pass", ResourceLimitsBuilder().WithTimeout(1).Build());
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, core::kTimeoutExitCode);
  auto kill = transport_->Last("POST", "/containers/abc123/kill");
  ASSERT_TRUE(kill.has_value());
  EXPECT_EQ(kill->path, "/containers/abc123/kill?signal=SIGKILL");
  EXPECT_EQ(transport_->Count("DELETE", "/containers/abc123"), 1);
}

TEST_F(ContainerSandboxTest, EngineUnreachableLeavesNothingBehind) {
  transport_->Fail("GET", "/_ping");
  try {
    MakeSandbox()->Execute("print(1)", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::ENGINE_UNREACHABLE);
    EXPECT_EQ(e.Backend(), "container-engine");
    EXPECT_THAT(e.what(), HasSubstr("Docker engine unreachable at fake://engine"));
  }
  EXPECT_EQ(transport_->Count("POST", "/containers/create"), 0);
}

TEST_F(ContainerSandboxTest, ReadinessIsCached) {
  ScriptDockerRun(*transport_, "abc123", 0, "", "");
  auto sandbox = MakeSandbox();
  sandbox->Execute("print(1)", ResourceLimits());
  sandbox->Execute("print(2)", ResourceLimits());
  EXPECT_EQ(transport_->Count("GET", "/_ping"), 1);
  EXPECT_EQ(transport_->Count("POST", "/containers/create"), 2);
}

TEST_F(ContainerSandboxTest, MissingImageIsPulled) {
  ScriptDockerRun(*transport_, "abc123", 0, "", "");
  transport_->On("GET", "/images/", 404, R"({"message":"No such image"})");
  transport_->On("POST", "/images/create", 200, "{\"status\":\"Pulling\"}\n{\"status\":\"Done\"}\n");
  auto sandbox = MakeSandbox();
  sandbox->CheckReady();
  auto pull = transport_->Last("POST", "/images/create");
  ASSERT_TRUE(pull.has_value());
  EXPECT_EQ(pull->path, "/images/create?fromImage=python&tag=3.12-slim");
}

TEST_F(ContainerSandboxTest, PullErrorInStream) {
  transport_->On("GET", "/_ping", 200, "OK");
  transport_->On("GET", "/images/", 404);
  transport_->On("POST", "/images/create", 200, "{\"error\":\"manifest unknown\"}\n");
  try {
    MakeSandbox()->CheckReady();
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::IMAGE_UNAVAILABLE);
    EXPECT_THAT(e.what(), HasSubstr("manifest unknown"));
  }
}

TEST_F(ContainerSandboxTest, MissingImageWithoutPull) {
  config_.pull_missing_image = false;
  transport_->On("GET", "/_ping", 200, "OK");
  transport_->On("GET", "/images/", 404);
  try {
    MakeSandbox()->CheckReady();
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::IMAGE_UNAVAILABLE);
  }
  EXPECT_EQ(transport_->Count("POST", "/images/create"), 0);
}

TEST_F(ContainerSandboxTest, CreateRejected) {
  ScriptDockerRun(*transport_, "abc123", 0, "", "");
  transport_->On("POST", "/containers/create", 409, R"({"message":"Conflict. The container name is already in use"})");
  try {
    MakeSandbox()->Execute("print(1)", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::UNIT_CREATE_FAILED);
    EXPECT_THAT(e.what(), HasSubstr("already in use"));
  }
  EXPECT_EQ(transport_->Count("DELETE", "/containers/"), 0);
}

TEST_F(ContainerSandboxTest, StartFailureStillRemovesContainer) {
  ScriptDockerRun(*transport_, "abc123", 0, "", "");
  transport_->On("POST", "/containers/abc123/start", 500, R"({"message":"OCI runtime create failed"})");
  try {
    MakeSandbox()->Execute("print(1)", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::UNIT_START_FAILED);
    EXPECT_EQ(e.UnitId(), "abc123");
  }
  EXPECT_EQ(transport_->Count("DELETE", "/containers/abc123"), 1);
}

TEST_F(ContainerSandboxTest, AlreadyRemovedContainerIsFine) {
  ScriptDockerRun(*transport_, "abc123", 0, "ok", "");
  transport_->On("DELETE", "/containers/abc123", 404, R"({"message":"No such container"})");
  EXPECT_TRUE(MakeSandbox()->Execute("print('ok')", ResourceLimits()).success);
}

TEST_F(ContainerSandboxTest, RemovalFailureIsRetriedThenReported) {
  ScriptDockerRun(*transport_, "abc123", 0, "ok", "");
  transport_->On("DELETE", "/containers/abc123", 500, R"({"message":"device or resource busy"})");
  try {
    MakeSandbox()->Execute("print('ok')", ResourceLimits());
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& e) {
    EXPECT_EQ(e.Kind(), SandboxErrorKind::TEARDOWN_FAILED);
  }
  EXPECT_EQ(transport_->Count("DELETE", "/containers/abc123"), 3);
}

TEST_F(ContainerSandboxTest, MissingStatsDoNotFailTheRun) {
  ScriptDockerRun(*transport_, "abc123", 0, "ok", "");
  transport_->On("GET", "/containers/abc123/stats", 500, R"({"message":"stats unavailable"})");
  const auto result = MakeSandbox()->Execute("print('ok')", ResourceLimits());
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.memory_used_mb.has_value());
}

TEST(DockerLogsTest, DemultiplexInterleavedFrames) {
  const auto raw = DockerLogFrame(1, "a") + DockerLogFrame(2, "err") + DockerLogFrame(1, "b");
  const auto logs = utils::DemultiplexLogs(raw);
  EXPECT_EQ(logs.stdout_output, "ab");
  EXPECT_EQ(logs.stderr_output, "err");
}

TEST(DockerLogsTest, UnframedLogsAreStdout) {
  EXPECT_EQ(utils::DemultiplexLogs("plain text").stdout_output, "plain text");
}

TEST(DockerLogsTest, ShortFinalFrameIsKept) {
  auto raw = DockerLogFrame(1, "abcdef");
  raw.resize(raw.size() - 2);
  EXPECT_EQ(utils::DemultiplexLogs(raw).stdout_output, "abcd");
}

TEST(DockerImageTest, SplitImageReference) {
  EXPECT_EQ(utils::SplitImageReference("python:3.12-slim"), std::make_pair(std::string("python"), std::string("3.12-slim")));
  EXPECT_EQ(utils::SplitImageReference("registry:5000/team/python"),
            std::make_pair(std::string("registry:5000/team/python"), std::string("latest")));
}

TEST(DockerEngineClientTest, ListContainersFiltersByLabel) {
  auto transport = std::make_shared<FakeTransport>();
  transport->On("GET", "/containers/json", 200, R"([{"Id":"a1","Names":["/x"]},{"Id":"b2"},{"Names":[]}])");
  utils::DockerEngineClient client(transport);

  EXPECT_THAT(client.ListContainers("codebox.managed=true"), ::testing::ElementsAre("a1", "b2"));
  const auto request = transport->Last("GET", "/containers/json");
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->path,
            "/containers/json?all=1&filters=%7B%22label%22%3A%5B%22codebox.managed%3Dtrue%22%5D%7D");
}

TEST(DockerEngineClientTest, ImageInspectEncodesReference) {
  auto transport = std::make_shared<FakeTransport>();
  transport->On("GET", "/images/", 200, R"({"Id":"sha256:abc"})");
  utils::DockerEngineClient client(transport);

  EXPECT_TRUE(client.ImageExists("registry.example.com:5000/team/python:3.12"));
  const auto request = transport->Last("GET", "/images/");
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->path, "/images/registry.example.com%3A5000%2Fteam%2Fpython%3A3.12/json");
}

TEST(UrlEncodeTest, EscapesAllButUnreserved) {
  EXPECT_EQ(utils::UrlEncode("a-b_c.d~e"), "a-b_c.d~e");
  EXPECT_EQ(utils::UrlEncode("k=v w/x?"), "k%3Dv%20w%2Fx%3F");
  EXPECT_EQ(utils::UrlEncode(""), "");
}
