/**
 * @file execution_tool.hpp
 * @brief Request-level entry point: validate, select a backend, execute, report
 *
 * ExecutionTool is the boundary a host (agent runtime, CLI) calls. It turns
 * every request into an ExecutionResponse: validation rejections, execution
 * failures, timeouts and backend errors all come back as data, and the
 * observer is told about each call exactly once.
 *
 * @date 2025
 */

#pragma once

#include "codebox/analyzers/code_validator.hpp"
#include "codebox/core/config.hpp"
#include "codebox/core/resource_limits.hpp"
#include "codebox/core/sandbox.hpp"
#include "codebox/monitors/execution_observer.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One code submission
 */
struct ExecutionRequest {
    std::string code;                             ///< Python source
    std::optional<int> timeout_override;          ///< Replaces the configured timeout
    std::optional<std::string> backend_override;  ///< Backend name or alias
};

/**
 * @struct ExecutionResponse
 * @brief Result handed back to the caller
 *
 * `exit_code` is the process exit code when code ran, 124 on timeout,
 * -1 on backend failure and 1 when the request was rejected before running.
 */
struct ExecutionResponse {
    bool success{false};
    std::string stdout_output;
    std::string stderr_output;
    double execution_time_seconds{0.0};
    std::optional<std::string> rejection_reason;  ///< Set when nothing was executed
    int exit_code{1};
    bool timed_out{false};
    monitors::ExecutionOutcome outcome{monitors::ExecutionOutcome::VALIDATION_REJECTED};
    std::string backend;                          ///< Backend that ran the code, if any
    std::vector<analyzers::Violation> violations; ///< Validation failures
    std::string message;                          ///< Human-readable rendering
};

/**
 * @brief Builds the sandbox for a canonical backend name
 *
 * The default factory builds ContainerSandbox and ClusterJobSandbox from
 * Settings; tests substitute sandboxes over a fake transport.
 */
using SandboxFactory =
    std::function<std::shared_ptr<Sandbox>(const std::string& backend, const Settings& settings)>;

/**
 * @class ExecutionTool
 * @brief Validated, observed code execution over a configured backend
 *
 * **Request Flow**:
 * 1. Feature flag off: DISABLED rejection
 * 2. CodeValidator with the configured allow-list: VALIDATION_REJECTED
 * 3. Timeout override applied to the base limits (invalid: rejection)
 * 4. Backend override resolved (unknown or unavailable: rejection)
 * 5. Sandbox::Execute; SandboxError becomes BACKEND_ERROR with exit code -1
 *
 * **Thread Safety**: Execute() may be called concurrently.
 */
class ExecutionTool {
public:
    /**
     * @brief Validate settings and build backends
     *
     * With the feature flag on, the configured backend must build; the other
     * backend is built when its configuration allows and is otherwise
     * unavailable for overrides.
     *
     * @throws ConfigError for invalid settings or an unbuildable default backend
     */
    explicit ExecutionTool(Settings settings,
                           SandboxFactory factory = DefaultSandboxFactory,
                           std::shared_ptr<monitors::ExecutionObserver> observer =
                               std::make_shared<monitors::LoggingObserver>());

    /**
     * @brief Handle one request
     * @param request Code and overrides
     * @param token Optional cancellation token forwarded to the sandbox
     */
    ExecutionResponse Execute(const ExecutionRequest& request,
                              CancellationToken* token = nullptr);

    /// Validation only, with the configured allow-list
    analyzers::ValidationResult Validate(const std::string& code) const;

    bool IsEnabled() const { return settings_.enable_code_execution; }
    const std::string& DefaultBackend() const { return default_backend_; }
    const ResourceLimits& BaseLimits() const { return base_limits_; }
    const Settings& GetSettings() const { return settings_; }

    /// Canonical names of the backends that were built
    std::vector<std::string> AvailableBackends() const;

    /// Sandbox for a backend name or alias, nullptr when unavailable
    std::shared_ptr<Sandbox> GetSandbox(const std::string& backend) const;

    /**
     * @brief Build ContainerSandbox or ClusterJobSandbox from settings
     * @throws ConfigError if the backend's credentials cannot be resolved
     */
    static std::shared_ptr<Sandbox> DefaultSandboxFactory(const std::string& backend,
                                                          const Settings& settings);

private:
    ExecutionResponse Handle(const ExecutionRequest& request, CancellationToken* token);

    ExecutionResponse Reject(monitors::ExecutionOutcome outcome, const std::string& reason) const;

    Settings settings_;
    ResourceLimits base_limits_;
    analyzers::CodeValidator validator_;
    std::string default_backend_;
    std::map<std::string, std::shared_ptr<Sandbox>> sandboxes_;
    std::shared_ptr<monitors::ExecutionObserver> observer_;
};

} // namespace core
} // namespace codebox
