/**
 * @file execution_observer.cpp
 * @brief Logging and counting execution observers
 *
 * @date 2025
 */

#include "codebox/monitors/execution_observer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

namespace codebox {
namespace monitors {

namespace {

const ExecutionOutcome kAllOutcomes[kExecutionOutcomeCount] = {
    ExecutionOutcome::VALIDATION_REJECTED,
    ExecutionOutcome::EXECUTED_SUCCESS,
    ExecutionOutcome::EXECUTED_FAILURE,
    ExecutionOutcome::TIMED_OUT,
    ExecutionOutcome::BACKEND_ERROR,
    ExecutionOutcome::DISABLED
};

std::size_t Index(ExecutionOutcome outcome) {
    return static_cast<std::size_t>(outcome);
}

} // anonymous namespace

std::string ExecutionOutcomeToString(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::VALIDATION_REJECTED: return "validation_rejected";
        case ExecutionOutcome::EXECUTED_SUCCESS: return "executed_success";
        case ExecutionOutcome::EXECUTED_FAILURE: return "executed_failure";
        case ExecutionOutcome::TIMED_OUT: return "timed_out";
        case ExecutionOutcome::BACKEND_ERROR: return "backend_error";
        case ExecutionOutcome::DISABLED: return "disabled";
    }
    return "unknown";
}

// ============================================================================
// LOGGING OBSERVER
// ============================================================================

void LoggingObserver::OnExecution(ExecutionOutcome outcome, const std::string& backend,
                                  double duration_seconds) {
    const std::string where = backend.empty() ? "-" : backend;
    switch (outcome) {
        case ExecutionOutcome::BACKEND_ERROR:
            spdlog::error("execution outcome={} backend={} duration={:.3f}s",
                          ExecutionOutcomeToString(outcome), where, duration_seconds);
            break;
        case ExecutionOutcome::VALIDATION_REJECTED:
        case ExecutionOutcome::TIMED_OUT:
            spdlog::warn("execution outcome={} backend={} duration={:.3f}s",
                         ExecutionOutcomeToString(outcome), where, duration_seconds);
            break;
        default:
            spdlog::info("execution outcome={} backend={} duration={:.3f}s",
                         ExecutionOutcomeToString(outcome), where, duration_seconds);
            break;
    }
}

// ============================================================================
// EXECUTION METRICS
// ============================================================================

ExecutionMetrics::ExecutionMetrics() {
    for (auto& count : counts_) {
        count.store(0);
    }
}

void ExecutionMetrics::OnExecution(ExecutionOutcome outcome, const std::string& /*backend*/,
                                   double duration_seconds) {
    counts_[Index(outcome)].fetch_add(1, std::memory_order_relaxed);
    if (duration_seconds > 0.0) {
        total_duration_micros_.fetch_add(
            static_cast<std::uint64_t>(std::llround(duration_seconds * 1e6)),
            std::memory_order_relaxed);
    }
}

std::uint64_t ExecutionMetrics::Count(ExecutionOutcome outcome) const {
    return counts_[Index(outcome)].load(std::memory_order_relaxed);
}

std::uint64_t ExecutionMetrics::Total() const {
    std::uint64_t total = 0;
    for (const auto& count : counts_) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

double ExecutionMetrics::TotalDurationSeconds() const {
    return static_cast<double>(total_duration_micros_.load(std::memory_order_relaxed)) / 1e6;
}

nlohmann::json ExecutionMetrics::ToJson() const {
    nlohmann::json outcomes = nlohmann::json::object();
    for (auto outcome : kAllOutcomes) {
        outcomes[ExecutionOutcomeToString(outcome)] = Count(outcome);
    }
    return {
        {"total", Total()},
        {"total_duration_seconds", TotalDurationSeconds()},
        {"outcomes", outcomes}
    };
}

// ============================================================================
// COMPOSITE OBSERVER
// ============================================================================

void CompositeObserver::OnExecution(ExecutionOutcome outcome, const std::string& backend,
                                    double duration_seconds) {
    for (const auto& observer : observers_) {
        if (observer) {
            observer->OnExecution(outcome, backend, duration_seconds);
        }
    }
}

} // namespace monitors
} // namespace codebox
