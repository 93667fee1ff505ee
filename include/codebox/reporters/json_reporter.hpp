/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON rendering of validation and execution results
 *
 * Used by the CLI's `--json` output and by hosts that forward responses
 * over a JSON channel.
 *
 * **Response document**:
 * ```json
 * {
 *   "success": true,
 *   "outcome": "executed_success",
 *   "backend": "container-engine",
 *   "exit_code": 0,
 *   "timed_out": false,
 *   "execution_time_seconds": 0.42,
 *   "stdout": "6\n",
 *   "stderr": "",
 *   "message": "Execution successful (0.42s)..."
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "codebox/analyzers/code_validator.hpp"
#include "codebox/core/execution_tool.hpp"
#include "codebox/core/sandbox.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace codebox {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Formatting options
 */
struct JsonReporterConfig {
    bool pretty_print{true};       ///< Indent nested values
    int indent_size{2};            ///< Indentation spaces
    bool include_output{true};     ///< Include stdout/stderr
    bool include_message{true};    ///< Include the rendered message
};

/**
 * @class JsonReporter
 * @brief Converts result types to nlohmann::json documents
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /// {"is_valid", "violations": [{"rule", "line", "column", "description"}], "warnings"}
    nlohmann::json ToJson(const analyzers::ValidationResult& result) const;

    nlohmann::json ToJson(const core::ExecutionResponse& response) const;

    nlohmann::json ToJson(const core::ExecutionResult& result) const;

    /// Serialize with the configured formatting
    std::string Render(const nlohmann::json& document) const;

    /**
     * @brief Write a rendered document to a file
     * @return false if the file could not be written (logged)
     */
    bool SaveJson(const nlohmann::json& document, const std::filesystem::path& output_path) const;

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace codebox
