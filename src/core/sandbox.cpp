/**
 * @file sandbox.cpp
 * @brief Supervision loop shared by all sandbox backends
 *
 * **Execution Workflow**:
 * 1. **Readiness**: backend verifies its runtime (cached after first success)
 * 2. **Create**: unit built with limits as native constraints
 * 3. **Start**: deadline armed
 * 4. **Supervise**: poll, waiting on the cancellation token between polls
 * 5. **Terminate**: on deadline or cancellation, one forced-kill path
 * 6. **Collect**: stdout/stderr sanitized to UTF-8 and truncated
 * 7. **Teardown**: always, retried with backoff
 *
 * @date 2025
 */

#include "codebox/core/sandbox.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace codebox {
namespace core {

using utils::StringUtils;

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string SandboxStateToString(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "created";
        case SandboxState::RUNNING: return "running";
        case SandboxState::COMPLETED: return "completed";
        case SandboxState::TIMED_OUT: return "timed_out";
        case SandboxState::FAILED: return "failed";
    }
    return "unknown";
}

std::string SandboxErrorKindToString(SandboxErrorKind kind) {
    switch (kind) {
        case SandboxErrorKind::ENGINE_UNREACHABLE: return "engine_unreachable";
        case SandboxErrorKind::IMAGE_UNAVAILABLE: return "image_unavailable";
        case SandboxErrorKind::UNIT_CREATE_FAILED: return "unit_create_failed";
        case SandboxErrorKind::UNIT_START_FAILED: return "unit_start_failed";
        case SandboxErrorKind::UNIT_MONITOR_FAILED: return "unit_monitor_failed";
        case SandboxErrorKind::OUTPUT_COLLECTION_FAILED: return "output_collection_failed";
        case SandboxErrorKind::TEARDOWN_FAILED: return "teardown_failed";
        case SandboxErrorKind::CONFIGURATION: return "configuration";
    }
    return "unknown";
}

SandboxError::SandboxError(SandboxErrorKind kind, std::string backend,
                           const std::string& message, std::string unit_id)
    : std::runtime_error(message)
    , kind_(kind)
    , backend_(std::move(backend))
    , unit_id_(std::move(unit_id)) {}

// ============================================================================
// CANCELLATION
// ============================================================================

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

// ============================================================================
// SANDBOX
// ============================================================================

Sandbox::Sandbox(SupervisionOptions options)
    : options_(options) {}

void Sandbox::CheckReady() {
    try {
        EnsureReady();
    }
    catch (const SandboxError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw SandboxError(SandboxErrorKind::ENGINE_UNREACHABLE, Name(),
                           fmt::format("Readiness check failed: {}", e.what()));
    }
}

ExecutionResult Sandbox::Execute(const std::string& code, const ResourceLimits& limits,
                                 CancellationToken* token) {
    if (StringUtils::IsBlank(code)) {
        ExecutionResult result;
        result.exit_code = 1;
        result.stderr_output = "Error: Empty code provided";
        result.error_message = "Empty code provided";
        result.final_state = SandboxState::COMPLETED;
        return result;
    }

    CheckReady();

    std::string unit_id;
    try {
        unit_id = CreateUnit(code, limits);
    }
    catch (const SandboxError&) {
        throw;
    }
    catch (const std::exception& e) {
        // Nothing was created, so there is nothing to tear down
        throw SandboxError(SandboxErrorKind::UNIT_CREATE_FAILED, Name(),
                           fmt::format("Unit creation failed: {}", e.what()));
    }
    spdlog::debug("[{}] Created unit {} ({})", Name(), unit_id, limits.ToString());

    ExecutionResult result;
    try {
        result = Supervise(unit_id, limits, token);
    }
    catch (const SandboxError& e) {
        spdlog::error("[{}] Execution of unit {} failed: {}", Name(), unit_id, e.what());
        try {
            Teardown(unit_id);
        }
        catch (const SandboxError& teardown_error) {
            spdlog::error("[{}] {} (while handling: {})", Name(), teardown_error.what(), e.what());
        }
        throw;
    }
    catch (const std::exception& e) {
        SandboxError wrapped(SandboxErrorKind::UNIT_MONITOR_FAILED, Name(),
                             fmt::format("Supervision of unit {} failed: {}", unit_id, e.what()),
                             unit_id);
        spdlog::error("[{}] {}", Name(), wrapped.what());
        try {
            Teardown(unit_id);
        }
        catch (const SandboxError& teardown_error) {
            spdlog::error("[{}] {} (while handling: {})", Name(), teardown_error.what(), e.what());
        }
        throw wrapped;
    }

    Teardown(unit_id);

    spdlog::debug("[{}] Unit {} finished: state={}, exit_code={}, {:.2f}s",
                  Name(), unit_id, SandboxStateToString(result.final_state),
                  result.exit_code, result.execution_time_seconds);
    return result;
}

AsyncExecution Sandbox::ExecuteAsync(std::string code, ResourceLimits limits) {
    auto self = shared_from_this();
    auto token = std::make_shared<CancellationToken>();

    AsyncExecution execution;
    execution.token = token;
    execution.result = std::async(std::launch::async,
        [self, token, code = std::move(code), limits = std::move(limits)]() {
            return self->Execute(code, limits, token.get());
        });
    return execution;
}

ExecutionResult Sandbox::Supervise(const std::string& unit_id, const ResourceLimits& limits,
                                   CancellationToken* token) {
    StartUnit(unit_id);

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::chrono::seconds(limits.TimeoutSeconds());

    while (true) {
        UnitStatus status = PollUnit(unit_id);
        if (status.finished) {
            return BuildResult(unit_id, limits, status, status.deadline_exceeded, false, started);
        }

        const bool cancelled = token != nullptr && token->IsCancelled();
        const auto now = std::chrono::steady_clock::now();
        if (cancelled || now >= deadline) {
            spdlog::warn("[{}] Terminating unit {}: {}", Name(), unit_id,
                         cancelled ? "cancelled" : "deadline reached");
            TerminateUnit(unit_id);
            status.finished = true;
            status.exit_code = kTimeoutExitCode;
            return BuildResult(unit_id, limits, status, !cancelled, cancelled, started);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                               + std::chrono::milliseconds(1);
        const auto wait = std::min(options_.poll_interval, remaining);
        if (token != nullptr) {
            token->WaitFor(wait);
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
}

ExecutionResult Sandbox::BuildResult(const std::string& unit_id, const ResourceLimits& limits,
                                     const UnitStatus& status, bool timed_out, bool cancelled,
                                     std::chrono::steady_clock::time_point started) {
    ExecutionResult result;
    result.execution_time_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    UnitOutput output;
    if (timed_out || cancelled) {
        // Partial output of a killed unit is informational only
        try {
            output = CollectOutput(unit_id, status);
        }
        catch (const SandboxError& e) {
            spdlog::warn("[{}] Partial output of unit {} unavailable: {}", Name(), unit_id, e.what());
        }
    } else {
        output = CollectOutput(unit_id, status);
    }

    result.stdout_output = StringUtils::TruncateOutput(StringUtils::SanitizeUtf8(output.stdout_output));
    result.stderr_output = StringUtils::TruncateOutput(StringUtils::SanitizeUtf8(output.stderr_output));
    result.memory_used_mb = output.memory_used_mb;

    if (timed_out) {
        result.exit_code = kTimeoutExitCode;
        result.timed_out = true;
        result.final_state = SandboxState::TIMED_OUT;
        result.error_message = fmt::format("Execution timed out after {} seconds", limits.TimeoutSeconds());
        if (result.stderr_output.empty()) {
            result.stderr_output = fmt::format("Execution timed out after {}s", limits.TimeoutSeconds());
        }
    } else if (cancelled) {
        result.exit_code = kTimeoutExitCode;
        result.cancelled = true;
        result.final_state = SandboxState::TIMED_OUT;
        result.error_message = fmt::format("Execution cancelled after {:.2f} seconds",
                                           result.execution_time_seconds);
        if (result.stderr_output.empty()) {
            result.stderr_output = "Execution cancelled";
        }
    } else {
        result.exit_code = status.exit_code;
        result.success = status.exit_code == 0;
        result.final_state = SandboxState::COMPLETED;
        if (status.oom_killed) {
            result.success = false;
            result.error_message = fmt::format("Process killed: memory limit of {} MB exceeded",
                                               limits.MemoryLimitMb());
        } else if (status.exit_code != 0) {
            result.error_message = fmt::format("Process exited with code {}", status.exit_code);
        }
    }
    return result;
}

void Sandbox::Teardown(const std::string& unit_id) {
    std::string last_error;
    auto backoff = options_.teardown_backoff;
    for (int attempt = 1; attempt <= options_.teardown_attempts; ++attempt) {
        try {
            DestroyUnit(unit_id);
            spdlog::debug("[{}] Removed unit {}", Name(), unit_id);
            return;
        }
        catch (const SandboxError& e) {
            last_error = e.what();
            spdlog::warn("[{}] Teardown attempt {}/{} for unit {} failed: {}",
                         Name(), attempt, options_.teardown_attempts, unit_id, last_error);
        }
        if (attempt < options_.teardown_attempts) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    throw SandboxError(SandboxErrorKind::TEARDOWN_FAILED, Name(),
                       fmt::format("Failed to remove unit {} after {} attempts: {}",
                                   unit_id, options_.teardown_attempts, last_error),
                       unit_id);
}

} // namespace core
} // namespace codebox
