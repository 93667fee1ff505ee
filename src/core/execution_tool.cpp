/**
 * @file execution_tool.cpp
 * @brief ExecutionTool request handling and response rendering
 *
 * @date 2025
 */

#include "codebox/core/execution_tool.hpp"
#include "codebox/backends/cluster_job_sandbox.hpp"
#include "codebox/backends/container_sandbox.hpp"
#include "codebox/utils/hash_utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>


namespace codebox {
namespace core {

using monitors::ExecutionOutcome;

namespace {

Settings Checked(Settings settings) {
    settings.Validate();
    return settings;
}

analyzers::CodeValidator::Config ValidatorConfig(const Settings& settings) {
    analyzers::CodeValidator::Config config;
    config.allowed_imports = settings.AllowedImportSet();
    return config;
}

std::string RenderValidationFailure(const analyzers::ValidationResult& validation) {
    std::string message = "Code validation failed:";
    for (const auto& violation : validation.Violations()) {
        message += "\n- " + violation.ToString();
    }
    return message;
}

void AppendSection(std::string& message, const std::string& title, const std::string& body) {
    if (!body.empty()) {
        message += fmt::format("\n\n{}:\n{}", title, body);
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ExecutionTool::ExecutionTool(Settings settings, SandboxFactory factory,
                             std::shared_ptr<monitors::ExecutionObserver> observer)
    : settings_(Checked(std::move(settings)))
    , base_limits_(settings_.BuildLimits())
    , validator_(ValidatorConfig(settings_))
    , default_backend_(Settings::CanonicalBackend(settings_.backend))
    , observer_(std::move(observer)) {

    if (!settings_.enable_code_execution) {
        spdlog::info("Code execution is disabled; requests will be rejected");
        return;
    }

    try {
        auto sandbox = factory(default_backend_, settings_);
        if (!sandbox) {
            throw ConfigError("factory returned no sandbox");
        }
        sandboxes_[default_backend_] = std::move(sandbox);
    } catch (const std::exception& e) {
        throw ConfigError(fmt::format("Cannot initialise {} backend: {}", default_backend_, e.what()));
    }

    const std::string other = default_backend_ == Settings::kContainerBackend
                                  ? Settings::kClusterBackend
                                  : Settings::kContainerBackend;
    try {
        auto sandbox = factory(other, settings_);
        if (sandbox) {
            sandboxes_[other] = std::move(sandbox);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Backend {} unavailable for overrides: {}", other, e.what());
    }

    spdlog::info("Code execution enabled: default backend {}, limits {}",
                 default_backend_, base_limits_.ToString());
}

std::shared_ptr<Sandbox> ExecutionTool::DefaultSandboxFactory(const std::string& backend,
                                                              const Settings& settings) {
    const std::string canonical = Settings::CanonicalBackend(backend);
    if (canonical == Settings::kContainerBackend) {
        backends::ContainerSandbox::Config config;
        config.image = settings.image;
        config.socket_path = settings.docker_socket;
        config.use_storage_opt = settings.docker_storage_opt;
        return backends::ContainerSandbox::Create(config);
    }

    utils::ClusterCredentials credentials;
    try {
        credentials = settings.k8s_in_cluster
            ? utils::ClusterCredentials::InCluster()
            : utils::ClusterCredentials::External(settings.k8s_api_server,
                                                  settings.k8s_token,
                                                  settings.k8s_token_file,
                                                  settings.k8s_ca_file,
                                                  settings.k8s_client_cert,
                                                  settings.k8s_client_key,
                                                  settings.k8s_insecure_skip_tls_verify);
    } catch (const utils::ClusterConfigError& e) {
        throw ConfigError(e.what());
    }

    backends::ClusterJobSandbox::Config config;
    config.image = settings.image;
    config.job_namespace = settings.k8s_namespace;
    config.job_ttl_seconds = settings.k8s_job_ttl;
    config.create_network_policy = settings.k8s_network_policy;
    return backends::ClusterJobSandbox::Create(config, credentials);
}

std::vector<std::string> ExecutionTool::AvailableBackends() const {
    std::vector<std::string> names;
    for (const auto& entry : sandboxes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<Sandbox> ExecutionTool::GetSandbox(const std::string& backend) const {
    if (!Settings::IsKnownBackend(backend)) {
        return nullptr;
    }
    auto it = sandboxes_.find(Settings::CanonicalBackend(backend));
    return it == sandboxes_.end() ? nullptr : it->second;
}

analyzers::ValidationResult ExecutionTool::Validate(const std::string& code) const {
    return validator_.Validate(code);
}

// ============================================================================
// REQUEST HANDLING
// ============================================================================

ExecutionResponse ExecutionTool::Execute(const ExecutionRequest& request, CancellationToken* token) {
    ExecutionResponse response = Handle(request, token);
    if (observer_) {
        observer_->OnExecution(response.outcome, response.backend, response.execution_time_seconds);
    }
    return response;
}

ExecutionResponse ExecutionTool::Reject(ExecutionOutcome outcome, const std::string& reason) const {
    ExecutionResponse response;
    response.outcome = outcome;
    response.exit_code = 1;
    response.rejection_reason = reason;
    response.message = reason;
    return response;
}

ExecutionResponse ExecutionTool::Handle(const ExecutionRequest& request, CancellationToken* token) {
    if (!settings_.enable_code_execution) {
        return Reject(ExecutionOutcome::DISABLED,
                      "Code execution is disabled. Set CODEBOX_ENABLE_CODE_EXECUTION=true to enable it.");
    }

    const std::string digest = utils::HashUtils::ShortDigest(request.code);
    spdlog::debug("Execution request {} ({} bytes)", digest, request.code.size());

    auto validation = validator_.Validate(request.code);
    for (const auto& warning : validation.Warnings()) {
        spdlog::debug("Request {}: {}", digest, warning);
    }
    if (!validation.IsValid()) {
        auto response = Reject(ExecutionOutcome::VALIDATION_REJECTED, RenderValidationFailure(validation));
        response.violations = validation.Violations();
        spdlog::info("Request {} rejected with {} violation(s)", digest, response.violations.size());
        return response;
    }

    ResourceLimits limits = base_limits_;
    if (request.timeout_override) {
        try {
            limits = base_limits_.WithTimeout(*request.timeout_override);
        } catch (const ResourceLimitError& e) {
            return Reject(ExecutionOutcome::VALIDATION_REJECTED,
                          fmt::format("Invalid timeout override: {}", e.what()));
        }
    }

    std::string backend = default_backend_;
    if (request.backend_override) {
        if (!Settings::IsKnownBackend(*request.backend_override)) {
            return Reject(ExecutionOutcome::VALIDATION_REJECTED,
                          fmt::format("Unknown backend '{}'", *request.backend_override));
        }
        backend = Settings::CanonicalBackend(*request.backend_override);
    }
    auto it = sandboxes_.find(backend);
    if (it == sandboxes_.end()) {
        return Reject(ExecutionOutcome::VALIDATION_REJECTED,
                      fmt::format("Backend '{}' is not available", backend));
    }

    ExecutionResponse response;
    response.backend = backend;

    ExecutionResult result;
    try {
        result = it->second->Execute(request.code, limits, token);
    } catch (const SandboxError& e) {
        spdlog::error("Request {} failed on {}: {}", digest, backend, e.what());
        response.outcome = ExecutionOutcome::BACKEND_ERROR;
        response.exit_code = kBackendFailureExitCode;
        response.stderr_output = e.what();
        response.message = fmt::format("Execution failed: backend error: {}", e.what());
        return response;
    }

    response.success = result.success;
    response.stdout_output = result.stdout_output;
    response.stderr_output = result.stderr_output;
    response.execution_time_seconds = result.execution_time_seconds;
    response.exit_code = result.exit_code;
    response.timed_out = result.timed_out;

    if (result.timed_out || result.cancelled) {
        response.outcome = ExecutionOutcome::TIMED_OUT;
        response.message = result.cancelled
            ? fmt::format("Execution cancelled after {:.2f}s", result.execution_time_seconds)
            : fmt::format("Execution timed out after {}s", limits.TimeoutSeconds());
        AppendSection(response.message, "Partial output", result.stdout_output);
    } else if (result.success) {
        response.outcome = ExecutionOutcome::EXECUTED_SUCCESS;
        response.message = fmt::format("Execution successful ({:.2f}s)", result.execution_time_seconds);
        AppendSection(response.message, "Output", result.stdout_output);
        AppendSection(response.message, "Stderr", result.stderr_output);
    } else {
        response.outcome = ExecutionOutcome::EXECUTED_FAILURE;
        response.message = fmt::format("Execution failed (exit code {}, {:.2f}s)",
                                       result.exit_code, result.execution_time_seconds);
        AppendSection(response.message, "Errors",
                      result.stderr_output.empty() ? result.error_message : result.stderr_output);
        AppendSection(response.message, "Output", result.stdout_output);
    }

    spdlog::info("Request {} finished on {}: {} ({:.2f}s)", digest, backend,
                 monitors::ExecutionOutcomeToString(response.outcome), result.execution_time_seconds);
    return response;
}

} // namespace core
} // namespace codebox
