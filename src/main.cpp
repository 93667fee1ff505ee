/**
 * @file main.cpp
 * @brief codebox command-line interface
 *
 * Validates and runs untrusted Python code through the configured sandbox
 * backend. Results go to stdout (text or JSON), logs go to stderr.
 *
 * **Exit Codes**:
 * - 0: success
 * - 1: code ran and failed, or timed out
 * - 2: validation rejection, or execution disabled
 * - 3: backend infrastructure error
 * - 4: usage or configuration error
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "codebox/analyzers/code_validator.hpp"
#include "codebox/core/config.hpp"
#include "codebox/core/execution_tool.hpp"
#include "codebox/core/resource_limits.hpp"
#include "codebox/monitors/execution_observer.hpp"
#include "codebox/reporters/json_reporter.hpp"
#include "codebox/utils/string_utils.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>

using json = nlohmann::json;
using namespace codebox;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitExecutionFailed = 1;
constexpr int kExitRejected = 2;
constexpr int kExitBackendError = 3;
constexpr int kExitUsage = 4;

/*******************************************************************************
 * Input and Logging
 ******************************************************************************/

struct CodeSource {
    std::string inline_code;
    std::string file;
};

std::string ReadCode(const CodeSource& source) {
    if (!source.inline_code.empty()) {
        return source.inline_code;
    }
    if (!source.file.empty() && source.file != "-") {
        std::ifstream file(source.file, std::ios::binary);
        if (!file) {
            throw core::ConfigError("Cannot read " + source.file);
        }
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void ConfigureLogging(const std::string& level_name, int verbosity) {
    auto logger = spdlog::stderr_color_mt("codebox");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    spdlog::level::level_enum level = spdlog::level::from_str(utils::StringUtils::ToLower(level_name));
    if (verbosity >= 2) {
        level = spdlog::level::trace;
    } else if (verbosity == 1) {
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);
}

int OutcomeExitCode(monitors::ExecutionOutcome outcome) {
    switch (outcome) {
        case monitors::ExecutionOutcome::EXECUTED_SUCCESS:
            return kExitSuccess;
        case monitors::ExecutionOutcome::EXECUTED_FAILURE:
        case monitors::ExecutionOutcome::TIMED_OUT:
            return kExitExecutionFailed;
        case monitors::ExecutionOutcome::VALIDATION_REJECTED:
        case monitors::ExecutionOutcome::DISABLED:
            return kExitRejected;
        case monitors::ExecutionOutcome::BACKEND_ERROR:
            return kExitBackendError;
    }
    return kExitExecutionFailed;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunValidate(const core::Settings& settings, const CodeSource& source, bool as_json) {
    analyzers::CodeValidator::Config config;
    config.allowed_imports = settings.AllowedImportSet();
    analyzers::CodeValidator validator(config);

    const auto result = validator.Validate(ReadCode(source));
    if (as_json) {
        reporters::JsonReporter reporter;
        std::cout << reporter.Render(reporter.ToJson(result)) << std::endl;
    } else if (result.IsValid()) {
        std::cout << "Code is valid" << std::endl;
        for (const auto& warning : result.Warnings()) {
            std::cout << "warning: " << warning << std::endl;
        }
    } else {
        std::cout << "Code validation failed:" << std::endl;
        for (const auto& error : result.Errors()) {
            std::cout << "- " << error << std::endl;
        }
    }
    return result.IsValid() ? kExitSuccess : kExitRejected;
}

int RunExecute(const core::Settings& settings, const CodeSource& source,
               std::optional<int> timeout, std::optional<std::string> backend, bool as_json) {
    auto metrics = std::make_shared<monitors::ExecutionMetrics>();
    auto observer = std::make_shared<monitors::CompositeObserver>(
        std::vector<std::shared_ptr<monitors::ExecutionObserver>>{
            std::make_shared<monitors::LoggingObserver>(), metrics});

    core::ExecutionTool tool(settings, core::ExecutionTool::DefaultSandboxFactory, observer);

    core::ExecutionRequest request;
    request.code = ReadCode(source);
    request.timeout_override = timeout;
    request.backend_override = backend;

    const auto response = tool.Execute(request);
    if (as_json) {
        reporters::JsonReporter reporter;
        std::cout << reporter.Render(reporter.ToJson(response)) << std::endl;
    } else {
        std::cout << response.message << std::endl;
    }
    spdlog::debug("Metrics: {}", metrics->ToJson().dump());
    return OutcomeExitCode(response.outcome);
}

int RunLimits(const core::Settings& settings, const std::string& preset, bool list) {
    if (list) {
        for (const auto& name : core::ResourceLimits::PresetNames()) {
            std::cout << name << std::endl;
        }
        return kExitSuccess;
    }
    const auto limits = preset.empty() ? settings.BuildLimits() : core::ResourceLimits::FromPreset(preset);
    std::cout << limits.ToJson().dump(2) << std::endl;
    return kExitSuccess;
}

int RunCheck(const core::Settings& settings, const std::string& backend_name) {
    const std::string backend = core::Settings::CanonicalBackend(
        backend_name.empty() ? settings.backend : backend_name);
    auto sandbox = core::ExecutionTool::DefaultSandboxFactory(backend, settings);
    sandbox->CheckReady();
    std::cout << backend << ": ready" << std::endl;
    return kExitSuccess;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"codebox - validate and run untrusted Python code in a sandbox"};
    app.require_subcommand(1);

    std::string config_file;
    std::string log_level;
    int verbosity = 0;

    app.add_option("--config", config_file, "JSON settings file (environment variables override it)")
        ->check(CLI::ExistingFile);
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off");
    app.add_flag("-v,--verbose", verbosity, "Verbose logging (-vv for trace)");

    CodeSource source;
    bool as_json = false;

    // validate
    auto* validate = app.add_subcommand("validate", "Check code against the validation rules");
    validate->add_option("-c,--code", source.inline_code, "Code to validate");
    validate->add_option("-f,--file", source.file, "File to validate ('-' for stdin)");
    validate->add_flag("--json", as_json, "Print the result as JSON");

    // run
    int timeout = 0;
    std::string backend;
    std::string preset;
    bool enable = false;
    auto* run = app.add_subcommand("run", "Validate and execute code in the configured sandbox");
    run->add_option("-c,--code", source.inline_code, "Code to run");
    run->add_option("-f,--file", source.file, "File to run ('-' for stdin)");
    auto* timeout_option = run->add_option("--timeout", timeout, "Timeout override in seconds");
    auto* backend_option = run->add_option("--backend", backend, "Backend override (container-engine, cluster-job)");
    run->add_option("--preset", preset, "Resource limits preset");
    run->add_flag("--enable", enable, "Enable code execution for this invocation");
    run->add_flag("--json", as_json, "Print the response as JSON");

    // limits
    std::string limits_preset;
    bool list_presets = false;
    auto* limits = app.add_subcommand("limits", "Print resource limits as JSON");
    limits->add_option("--preset", limits_preset, "Preset to print instead of the configured limits");
    limits->add_flag("--list", list_presets, "List preset names");

    // config
    auto* config = app.add_subcommand("config", "Print the effective settings as JSON");

    // check
    std::string check_backend;
    auto* check = app.add_subcommand("check", "Check that the backend runtime is reachable");
    check->add_option("--backend", check_backend, "Backend to check (default: configured backend)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? kExitSuccess : kExitUsage;
    }

    try {
        core::Settings settings = core::Settings::Load(config_file);
        ConfigureLogging(log_level.empty() ? settings.log_level : log_level, verbosity);

        if (*validate) {
            return RunValidate(settings, source, as_json);
        }
        if (*run) {
            if (enable) {
                settings.enable_code_execution = true;
            }
            if (!preset.empty()) {
                settings.limits_preset = preset;
            }
            std::optional<int> timeout_override;
            if (timeout_option->count() > 0) {
                timeout_override = timeout;
            }
            std::optional<std::string> backend_override;
            if (backend_option->count() > 0) {
                backend_override = backend;
            }
            return RunExecute(settings, source, timeout_override, backend_override, as_json);
        }
        if (*limits) {
            return RunLimits(settings, limits_preset, list_presets);
        }
        if (*config) {
            std::cout << settings.ToJson().dump(2) << std::endl;
            return kExitSuccess;
        }
        if (*check) {
            return RunCheck(settings, check_backend);
        }
        return kExitUsage;

    } catch (const core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsage;
    } catch (const core::ResourceLimitError& e) {
        spdlog::error("Invalid limits: {}", e.what());
        return kExitUsage;
    } catch (const core::SandboxError& e) {
        spdlog::error("Backend error: {}", e.what());
        return kExitBackendError;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitBackendError;
    }
}
