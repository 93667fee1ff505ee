/**
 * @file execution_observer.hpp
 * @brief Outbound hook notified once per execution request
 *
 * The execution tool reports every request's outcome, backend and duration
 * to an ExecutionObserver. The host wires this to its own metrics pipeline;
 * a logging observer and an in-process counter set are provided.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codebox {
namespace monitors {

/**
 * @enum ExecutionOutcome
 * @brief Final classification of one request
 */
enum class ExecutionOutcome {
    VALIDATION_REJECTED,   ///< Code failed validation (or a bad override)
    EXECUTED_SUCCESS,      ///< Exit code 0
    EXECUTED_FAILURE,      ///< Non-zero exit code
    TIMED_OUT,             ///< Deadline reached or cancelled
    BACKEND_ERROR,         ///< Sandbox infrastructure failure
    DISABLED               ///< Code execution feature flag is off
};

constexpr std::size_t kExecutionOutcomeCount = 6;

std::string ExecutionOutcomeToString(ExecutionOutcome outcome);

/**
 * @class ExecutionObserver
 * @brief Receives one notification per request
 *
 * **Thread Safety**: Implementations must accept concurrent calls.
 */
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;

    /**
     * @param outcome Request classification
     * @param backend Backend name, empty when no backend was involved
     * @param duration_seconds Sandbox-reported execution time (0 if nothing ran)
     */
    virtual void OnExecution(ExecutionOutcome outcome, const std::string& backend,
                             double duration_seconds) = 0;
};

/**
 * @class LoggingObserver
 * @brief Writes one spdlog line per request
 */
class LoggingObserver : public ExecutionObserver {
public:
    void OnExecution(ExecutionOutcome outcome, const std::string& backend,
                     double duration_seconds) override;
};

/**
 * @class ExecutionMetrics
 * @brief Lock-free per-outcome counters and cumulative duration
 */
class ExecutionMetrics : public ExecutionObserver {
public:
    ExecutionMetrics();

    void OnExecution(ExecutionOutcome outcome, const std::string& backend,
                     double duration_seconds) override;

    std::uint64_t Count(ExecutionOutcome outcome) const;
    std::uint64_t Total() const;
    double TotalDurationSeconds() const;

    /**
     * @brief {"total": N, "total_duration_seconds": S, "outcomes": {"executed_success": N, ...}}
     */
    nlohmann::json ToJson() const;

private:
    std::array<std::atomic<std::uint64_t>, kExecutionOutcomeCount> counts_;
    std::atomic<std::uint64_t> total_duration_micros_{0};
};

/**
 * @class CompositeObserver
 * @brief Fans a notification out to several observers
 */
class CompositeObserver : public ExecutionObserver {
public:
    explicit CompositeObserver(std::vector<std::shared_ptr<ExecutionObserver>> observers)
        : observers_(std::move(observers)) {}

    void OnExecution(ExecutionOutcome outcome, const std::string& backend,
                     double duration_seconds) override;

private:
    std::vector<std::shared_ptr<ExecutionObserver>> observers_;
};

} // namespace monitors
} // namespace codebox
