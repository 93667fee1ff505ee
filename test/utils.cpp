#include "utils.h"

#include <nlohmann/json.hpp>

using codebox::utils::HttpRequest;
using codebox::utils::HttpResponse;
using codebox::utils::TransportError;

namespace {

bool Matches(const std::string& method, const std::string& prefix, const HttpRequest& request) {
  return request.method == method && request.path.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void FakeTransport::On(const std::string& method, const std::string& path_prefix,
                       long status, const std::string& body) {
  OnSequence(method, path_prefix, {Response(status, body)});
}

void FakeTransport::OnSequence(const std::string& method, const std::string& path_prefix,
                               std::vector<HttpResponse> responses) {
  std::lock_guard<std::mutex> lock(mutex_);
  Route route;
  route.method = method;
  route.prefix = path_prefix;
  route.responses.assign(responses.begin(), responses.end());
  routes_.push_back(std::move(route));
}

void FakeTransport::Fail(const std::string& method, const std::string& path_prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  Route route;
  route.method = method;
  route.prefix = path_prefix;
  route.fail = true;
  routes_.push_back(std::move(route));
}

HttpResponse FakeTransport::Send(const HttpRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  for (auto it = routes_.rbegin(); it != routes_.rend(); ++it) {
    if (!Matches(it->method, it->prefix, request)) continue;
    if (it->fail) {
      throw TransportError("connection refused: " + request.path);
    }
    HttpResponse response = it->responses.front();
    if (it->responses.size() > 1) it->responses.pop_front();
    return response;
  }
  return Response(404, R"({"message":"no route for )" + request.method + " " + request.path + R"("})");
}

std::vector<HttpRequest> FakeTransport::Requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

int FakeTransport::Count(const std::string& method, const std::string& path_prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  int count = 0;
  for (const auto& request : requests_) {
    if (Matches(method, path_prefix, request)) ++count;
  }
  return count;
}

std::optional<HttpRequest> FakeTransport::Last(const std::string& method,
                                               const std::string& path_prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
    if (Matches(method, path_prefix, *it)) return *it;
  }
  return std::nullopt;
}

HttpResponse Response(long status, const std::string& body) {
  HttpResponse response;
  response.status = status;
  response.body = body;
  return response;
}

std::string DockerLogFrame(int stream, const std::string& payload) {
  std::string frame(8, '\0');
  frame[0] = static_cast<char>(stream);
  const auto size = static_cast<std::uint32_t>(payload.size());
  frame[4] = static_cast<char>((size >> 24) & 0xFF);
  frame[5] = static_cast<char>((size >> 16) & 0xFF);
  frame[6] = static_cast<char>((size >> 8) & 0xFF);
  frame[7] = static_cast<char>(size & 0xFF);
  return frame + payload;
}

void ScriptDockerRun(FakeTransport& transport, const std::string& id, int exit_code,
                     const std::string& stdout_text, const std::string& stderr_text) {
  const std::string container = "/containers/" + id;
  transport.On("GET", "/_ping", 200, "OK");
  transport.On("GET", "/images/", 200, R"({"Id":"sha256:abc"})");
  transport.On("POST", "/containers/create", 201, nlohmann::json{{"Id", id}, {"Warnings", nlohmann::json::array()}}.dump());
  transport.On("POST", container + "/start", 204);
  transport.On("GET", container + "/json", 200,
               nlohmann::json{{"Id", id}, {"State", {{"Status", "exited"}, {"ExitCode", exit_code}, {"OOMKilled", false}}}}.dump());
  std::string logs;
  if (!stdout_text.empty()) logs += DockerLogFrame(1, stdout_text);
  if (!stderr_text.empty()) logs += DockerLogFrame(2, stderr_text);
  transport.On("GET", container + "/logs", 200, logs);
  transport.On("GET", container + "/stats", 200, R"({"memory_stats":{"usage":10485760}})");
  transport.On("POST", container + "/kill", 204);
  transport.On("DELETE", container, 204);
}

void ScriptDockerHang(FakeTransport& transport, const std::string& id) {
  ScriptDockerRun(transport, id, 0, "", "");
  transport.On("GET", "/containers/" + id + "/json", 200,
               nlohmann::json{{"Id", id}, {"State", {{"Status", "running"}, {"ExitCode", 0}}}}.dump());
}

codebox::core::SupervisionOptions FastSupervision() {
  codebox::core::SupervisionOptions options;
  options.poll_interval = std::chrono::milliseconds(5);
  options.teardown_attempts = 3;
  options.teardown_backoff = std::chrono::milliseconds(1);
  return options;
}

using codebox::core::SandboxError;
using codebox::core::SandboxErrorKind;

void ScriptedSandbox::EnsureReady() {
  calls.push_back("ready");
  if (fail_ready) {
    throw SandboxError(SandboxErrorKind::ENGINE_UNREACHABLE, name_, "runtime is down");
  }
  if (ready_throws_runtime_error) {
    throw std::runtime_error("credentials unreadable");
  }
}

std::string ScriptedSandbox::CreateUnit(const std::string& code,
                                        const codebox::core::ResourceLimits& limits) {
  calls.push_back("create");
  if (fail_create) {
    throw SandboxError(SandboxErrorKind::UNIT_CREATE_FAILED, name_, "create rejected");
  }
  if (create_throws_runtime_error) {
    throw std::runtime_error("RAND_bytes failed");
  }
  last_code = code;
  last_limits = limits;
  return "unit-1";
}

void ScriptedSandbox::StartUnit(const std::string&) {
  calls.push_back("start");
}

codebox::core::UnitStatus ScriptedSandbox::PollUnit(const std::string&) {
  ++polls;
  if (poll_throws_runtime_error) {
    throw std::runtime_error("status decode failed");
  }
  if (polls_until_exit >= 0 && polls > polls_until_exit) {
    return exit_status;
  }
  return codebox::core::UnitStatus{};
}

void ScriptedSandbox::TerminateUnit(const std::string&) {
  calls.push_back("terminate");
}

codebox::core::UnitOutput ScriptedSandbox::CollectOutput(const std::string&,
                                                         const codebox::core::UnitStatus&) {
  calls.push_back("collect");
  if (fail_collect) {
    throw SandboxError(SandboxErrorKind::OUTPUT_COLLECTION_FAILED, name_, "logs unavailable");
  }
  return output;
}

void ScriptedSandbox::DestroyUnit(const std::string& unit_id) {
  calls.push_back("destroy");
  ++destroy_attempts;
  if (destroy_attempts <= destroy_failures) {
    throw SandboxError(SandboxErrorKind::TEARDOWN_FAILED, name_, "busy", unit_id);
  }
}
