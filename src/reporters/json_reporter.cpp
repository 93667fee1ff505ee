/**
 * @file json_reporter.cpp
 * @brief JSON rendering of validation and execution results
 *
 * @date 2025
 */

#include "codebox/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace codebox {
namespace reporters {

using json = nlohmann::json;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {}

json JsonReporter::ToJson(const analyzers::ValidationResult& result) const {
    json violations = json::array();
    for (const auto& violation : result.Violations()) {
        violations.push_back({
            {"rule", analyzers::RuleKindToString(violation.kind)},
            {"line", violation.location.line},
            {"column", violation.location.column},
            {"description", violation.description}
        });
    }
    return {
        {"is_valid", result.IsValid()},
        {"violations", violations},
        {"warnings", result.Warnings()}
    };
}

json JsonReporter::ToJson(const core::ExecutionResponse& response) const {
    json j;
    j["success"] = response.success;
    j["outcome"] = monitors::ExecutionOutcomeToString(response.outcome);
    j["backend"] = response.backend.empty() ? json(nullptr) : json(response.backend);
    j["exit_code"] = response.exit_code;
    j["timed_out"] = response.timed_out;
    j["execution_time_seconds"] = response.execution_time_seconds;
    j["rejection_reason"] = response.rejection_reason ? json(*response.rejection_reason) : json(nullptr);

    if (config_.include_output) {
        j["stdout"] = response.stdout_output;
        j["stderr"] = response.stderr_output;
    }
    if (!response.violations.empty()) {
        j["violations"] = ToJson(analyzers::ValidationResult(response.violations, {}))["violations"];
    }
    if (config_.include_message) {
        j["message"] = response.message;
    }
    return j;
}

json JsonReporter::ToJson(const core::ExecutionResult& result) const {
    json j;
    j["success"] = result.success;
    j["state"] = core::SandboxStateToString(result.final_state);
    j["exit_code"] = result.exit_code;
    j["timed_out"] = result.timed_out;
    j["cancelled"] = result.cancelled;
    j["execution_time_seconds"] = result.execution_time_seconds;
    j["memory_used_mb"] = result.memory_used_mb ? json(*result.memory_used_mb) : json(nullptr);
    if (!result.error_message.empty()) {
        j["error_message"] = result.error_message;
    }
    if (config_.include_output) {
        j["stdout"] = result.stdout_output;
        j["stderr"] = result.stderr_output;
    }
    return j;
}

std::string JsonReporter::Render(const json& document) const {
    return document.dump(config_.pretty_print ? config_.indent_size : -1, ' ', false,
                         json::error_handler_t::replace);
}

bool JsonReporter::SaveJson(const json& document, const std::filesystem::path& output_path) const {
    std::ofstream file(output_path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }
    file << Render(document) << '\n';
    if (!file) {
        spdlog::error("Failed to write JSON to {}", output_path.string());
        return false;
    }
    return true;
}

} // namespace reporters
} // namespace codebox
