#ifndef CODEBOX_TEST_UTILS_H_
#define CODEBOX_TEST_UTILS_H_

#include <gtest/gtest.h>

#include "codebox/core/sandbox.hpp"
#include "codebox/utils/http_transport.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Scripted HttpTransport. Routes match on method and path prefix, the most
// recently registered route winning. A route with several responses returns
// them in order and then keeps returning the last one. Every request is
// recorded.
class FakeTransport : public codebox::utils::HttpTransport {
 public:
  void On(const std::string& method, const std::string& path_prefix,
          long status, const std::string& body = "");
  void OnSequence(const std::string& method, const std::string& path_prefix,
                  std::vector<codebox::utils::HttpResponse> responses);
  // Requests matching the route throw TransportError
  void Fail(const std::string& method, const std::string& path_prefix);

  codebox::utils::HttpResponse Send(const codebox::utils::HttpRequest& request) override;
  std::string Endpoint() const override { return "fake://engine"; }

  std::vector<codebox::utils::HttpRequest> Requests() const;
  int Count(const std::string& method, const std::string& path_prefix) const;
  std::optional<codebox::utils::HttpRequest> Last(const std::string& method,
                                                  const std::string& path_prefix) const;

 private:
  struct Route {
    std::string method;
    std::string prefix;
    std::deque<codebox::utils::HttpResponse> responses;
    bool fail{false};
  };

  mutable std::mutex mutex_;
  std::vector<Route> routes_;
  std::vector<codebox::utils::HttpRequest> requests_;
};

codebox::utils::HttpResponse Response(long status, const std::string& body = "");

// One frame of the Docker multiplexed log stream (1 = stdout, 2 = stderr)
std::string DockerLogFrame(int stream, const std::string& payload);

// Daemon that is up, has the image, and runs one container `id` to `exit_code`
void ScriptDockerRun(FakeTransport& transport, const std::string& id, int exit_code,
                     const std::string& stdout_text, const std::string& stderr_text);

// Daemon whose container `id` never leaves the running state
void ScriptDockerHang(FakeTransport& transport, const std::string& id);

// Fast polling and teardown for tests
codebox::core::SupervisionOptions FastSupervision();

// In-memory backend driven by plain fields
class ScriptedSandbox : public codebox::core::Sandbox {
 public:
  explicit ScriptedSandbox(std::string name = "scripted",
                           codebox::core::SupervisionOptions options = FastSupervision())
      : Sandbox(options), name_(std::move(name)) {}

  std::string Name() const override { return name_; }

  // Script
  int polls_until_exit{0};   ///< -1 never exits
  codebox::core::UnitStatus exit_status{true, 0, false, false};
  codebox::core::UnitOutput output;
  bool fail_ready{false};
  bool fail_create{false};
  bool ready_throws_runtime_error{false};
  bool create_throws_runtime_error{false};
  bool poll_throws_runtime_error{false};
  bool fail_collect{false};
  int destroy_failures{0};   ///< Destroy attempts that fail before one succeeds

  // Observations
  std::vector<std::string> calls;
  std::string last_code;
  std::optional<codebox::core::ResourceLimits> last_limits;
  int polls{0};
  int destroy_attempts{0};

 protected:
  void EnsureReady() override;
  std::string CreateUnit(const std::string& code, const codebox::core::ResourceLimits& limits) override;
  void StartUnit(const std::string& unit_id) override;
  codebox::core::UnitStatus PollUnit(const std::string& unit_id) override;
  void TerminateUnit(const std::string& unit_id) override;
  codebox::core::UnitOutput CollectOutput(const std::string& unit_id,
                                          const codebox::core::UnitStatus& status) override;
  void DestroyUnit(const std::string& unit_id) override;

 private:
  std::string name_;
};

#endif // CODEBOX_TEST_UTILS_H_
