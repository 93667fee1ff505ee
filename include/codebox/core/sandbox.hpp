/**
 * @file sandbox.hpp
 * @brief Abstract execution sandbox and its result/error types
 *
 * A sandbox runs one code string inside an isolated, resource-limited unit
 * (a container or a cluster job), supervises it against a deadline, captures
 * its output and always tears the unit down. Backends implement the unit
 * lifecycle hooks; the supervision loop lives here.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/resource_limits.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace codebox {
namespace core {

constexpr int kTimeoutExitCode = 124;         ///< Exit code reported for timed-out runs
constexpr int kBackendFailureExitCode = -1;   ///< Reserved for backend infrastructure failures

/**
 * @enum SandboxState
 * @brief Lifecycle state of one execution unit
 */
enum class SandboxState {
    CREATED,     ///< Unit exists, not started
    RUNNING,     ///< Unit started, deadline armed
    COMPLETED,   ///< Process exited on its own
    TIMED_OUT,   ///< Force-terminated at the deadline or on cancellation
    FAILED       ///< Backend infrastructure failure
};

std::string SandboxStateToString(SandboxState state);

/**
 * @struct ExecutionResult
 * @brief Outcome of one sandboxed execution
 *
 * Output fields are valid UTF-8 and capped at utils::kMaxOutputBytes.
 */
struct ExecutionResult {
    bool success{false};                        ///< Exit code 0 and not timed out
    std::string stdout_output;                  ///< Captured standard output
    std::string stderr_output;                  ///< Captured standard error
    double execution_time_seconds{0.0};         ///< Wall time from start to terminal state
    int exit_code{0};                           ///< Process exit code (124 on timeout)
    bool timed_out{false};                      ///< Deadline reached
    bool cancelled{false};                      ///< Stopped through a CancellationToken
    SandboxState final_state{SandboxState::CREATED};   ///< Terminal state
    std::string error_message;                  ///< Timeout, cancellation, OOM or exit description
    std::optional<double> memory_used_mb;       ///< Peak memory, when observable
};

/**
 * @enum SandboxErrorKind
 * @brief Category of backend infrastructure failure
 */
enum class SandboxErrorKind {
    ENGINE_UNREACHABLE,         ///< Runtime API not reachable
    IMAGE_UNAVAILABLE,          ///< Base image missing and could not be pulled
    UNIT_CREATE_FAILED,         ///< Container/job creation rejected
    UNIT_START_FAILED,          ///< Unit could not be started or scheduled
    UNIT_MONITOR_FAILED,        ///< Status polling failed
    OUTPUT_COLLECTION_FAILED,   ///< Logs could not be read
    TEARDOWN_FAILED,            ///< Unit could not be removed
    CONFIGURATION               ///< Backend misconfigured (namespace, credentials, ...)
};

std::string SandboxErrorKindToString(SandboxErrorKind kind);

/**
 * @class SandboxError
 * @brief Backend infrastructure failure; the only exception Execute() throws
 *
 * Failures of the executed code itself are never reported this way.
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(SandboxErrorKind kind, std::string backend, const std::string& message,
                 std::string unit_id = "");

    SandboxErrorKind Kind() const { return kind_; }
    const std::string& Backend() const { return backend_; }
    const std::string& UnitId() const { return unit_id_; }

private:
    SandboxErrorKind kind_;
    std::string backend_;
    std::string unit_id_;
};

/**
 * @class CancellationToken
 * @brief One-shot cancellation signal shared between a caller and a running execution
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class CancellationToken {
public:
    /// Request cancellation and wake any waiter
    void Cancel();

    bool IsCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep up to `duration`, returning early on cancellation
     * @return true if cancelled
     */
    bool WaitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @struct AsyncExecution
 * @brief Handle to an execution running on a background thread
 */
struct AsyncExecution {
    std::future<ExecutionResult> result;
    std::shared_ptr<CancellationToken> token;

    void Cancel() { token->Cancel(); }
};

/**
 * @struct UnitStatus
 * @brief One observation of a running unit
 */
struct UnitStatus {
    bool finished{false};            ///< Process reached a terminal state
    int exit_code{0};                ///< Valid when finished
    bool oom_killed{false};          ///< Runtime killed the process for memory
    bool deadline_exceeded{false};   ///< Runtime enforced its own deadline
};

/**
 * @struct UnitOutput
 * @brief Raw output collected from a unit
 */
struct UnitOutput {
    std::string stdout_output;
    std::string stderr_output;
    std::optional<double> memory_used_mb;
};

/**
 * @struct SupervisionOptions
 * @brief Timing of the supervision loop and teardown retries
 */
struct SupervisionOptions {
    std::chrono::milliseconds poll_interval{250};      ///< Delay between status polls
    int teardown_attempts{3};                          ///< Destroy attempts before giving up
    std::chrono::milliseconds teardown_backoff{200};   ///< Base backoff, doubled per attempt
};

/**
 * @class Sandbox
 * @brief Isolated execution environment for untrusted code
 *
 * Execute() drives one unit through Created -> Running -> terminal state:
 * 1. EnsureReady() (cached by the backend after the first success)
 * 2. CreateUnit() with limits translated into native constraints
 * 3. StartUnit(), arming the deadline
 * 4. PollUnit() until exit, deadline, or cancellation; the last two share
 *    the TerminateUnit() path
 * 5. CollectOutput(), then sanitize and truncate
 * 6. DestroyUnit(), always, with retries
 *
 * Implementations hold no per-invocation state, so one instance can serve
 * concurrent Execute() calls.
 *
 * **Usage Example**:
 * @code
 * auto sandbox = ContainerSandbox::Create(config);
 * auto result = sandbox->Execute("print('hi')", ResourceLimits::Testing());
 * if (result.timed_out) {
 *     spdlog::warn("{}", result.error_message);
 * }
 * @endcode
 */
class Sandbox : public std::enable_shared_from_this<Sandbox> {
public:
    virtual ~Sandbox() = default;

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /**
     * @brief Execute code synchronously
     *
     * @param code Python source (validated by the caller)
     * @param limits Resource limits for this run
     * @param token Optional cancellation token
     * @return Execution result; code failures and timeouts are data
     *
     * @throws SandboxError on backend infrastructure failure
     */
    ExecutionResult Execute(const std::string& code, const ResourceLimits& limits,
                            CancellationToken* token = nullptr);

    /**
     * @brief Execute code on a background thread
     *
     * The sandbox must be owned by a shared_ptr; the task keeps it alive.
     * A SandboxError is delivered through the future.
     */
    AsyncExecution ExecuteAsync(std::string code, ResourceLimits limits);

    /**
     * @brief Verify the backend runtime is reachable and usable
     * @throws SandboxError if it is not
     */
    void CheckReady();

    /// Backend name used in logs and errors ("container-engine", "cluster-job")
    virtual std::string Name() const = 0;

protected:
    explicit Sandbox(SupervisionOptions options = SupervisionOptions{});

    /// Verify the runtime is usable; implementations cache success
    virtual void EnsureReady() = 0;

    /// Create the unit; returns its identifier. Must not leave anything behind on failure.
    virtual std::string CreateUnit(const std::string& code, const ResourceLimits& limits) = 0;

    virtual void StartUnit(const std::string& unit_id) = 0;
    virtual UnitStatus PollUnit(const std::string& unit_id) = 0;

    /// Force-terminate a running unit
    virtual void TerminateUnit(const std::string& unit_id) = 0;

    virtual UnitOutput CollectOutput(const std::string& unit_id, const UnitStatus& status) = 0;

    /// Remove the unit; a unit that no longer exists counts as removed
    virtual void DestroyUnit(const std::string& unit_id) = 0;

    const SupervisionOptions& Options() const { return options_; }

private:
    ExecutionResult Supervise(const std::string& unit_id, const ResourceLimits& limits,
                              CancellationToken* token);
    ExecutionResult BuildResult(const std::string& unit_id, const ResourceLimits& limits,
                                const UnitStatus& status, bool timed_out, bool cancelled,
                                std::chrono::steady_clock::time_point started);
    void Teardown(const std::string& unit_id);

    SupervisionOptions options_;
};

} // namespace core
} // namespace codebox
