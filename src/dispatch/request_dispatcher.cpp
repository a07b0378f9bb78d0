#include "dispatch/request_dispatcher.hpp"

#include <exception>
#include <string>
#include <utility>

#include "utils/common.hpp"
#include "utils/encoding.hpp"
#include "utils/logging.hpp"

namespace vizrun::dispatch {

DispatcherLimits MakeDispatcherLimits(const config::Config& config) {
    DispatcherLimits limits;
    limits.max_code_length = config.limits.max_code_length;
    limits.request_timeout = std::chrono::seconds(config.limits.request_timeout_s);
    return limits;
}

RequestDispatcher::RequestDispatcher(DispatcherLimits limits,
                                     const adapters::AdapterRegistry& registry,
                                     governor::ResourceGovernor& governor,
                                     const sandbox::SandboxExecutor& executor,
                                     const output::OutputNormalizer& normalizer)
    : limits_(limits)
    , registry_(registry)
    , governor_(governor)
    , executor_(executor)
    , normalizer_(normalizer) {}

ValidationOutcome RequestDispatcher::Validate(const execution::VisualizationRequest& request) const {
    ValidationOutcome outcome;
    const auto language = execution::ParseLanguage(request.language);
    if (!language || !registry_.Has(*language)) {
        outcome.failure = execution::failures::Validation("Unsupported language");
        return outcome;
    }
    const auto viz_type = execution::ParseVizType(request.viz_type);
    if (!viz_type) {
        outcome.failure = execution::failures::Validation("Unsupported visualization type");
        return outcome;
    }
    if (utils::Trim(request.code).empty()) {
        outcome.failure = execution::failures::Validation("Code must not be empty");
        return outcome;
    }
    if (request.code.size() > limits_.max_code_length) {
        outcome.failure = execution::failures::Validation(
            "Code exceeds maximum length of " + std::to_string(limits_.max_code_length) + " characters");
        return outcome;
    }
    outcome.request.emplace(request.code, *language, *viz_type);
    return outcome;
}

execution::ExecutionResult RequestDispatcher::Dispatch(const execution::VisualizationRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + limits_.request_timeout;
    const auto request_id = utils::GenerateId();

    auto validation = Validate(request);
    if (!validation.Ok()) {
        utils::LogInfo("dispatch", "request rejected",
                       {{"id", request_id},
                        {"language", request.language},
                        {"viz_type", request.viz_type},
                        {"reason", validation.failure.message}});
        return execution::ExecutionResult::FromFailure(std::move(validation.failure));
    }

    auto result = Execute(*validation.request, deadline, request_id);
    const bool timed_out = result.IsFailure()
        && result.GetFailure().kind == execution::FailureKind::kExecutionTimeout;
    if (std::chrono::steady_clock::now() > deadline && !timed_out) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(limits_.request_timeout).count();
        result = execution::ExecutionResult::FromFailure(execution::failures::Timeout(seconds));
    }

    utils::LogFields fields{
        {"id", request_id},
        {"language", execution::ToString(validation.request->GetLanguage())},
        {"viz_type", execution::ToString(validation.request->GetVizType())},
        {"result", result.Describe()},
        {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}};
    if (result.IsArtifact()) {
        fields.emplace_back("bytes", std::to_string(result.GetArtifact().content.size()));
        fields.emplace_back("sha256", utils::Sha256Hex(result.GetArtifact().content).substr(0, 12));
    } else {
        fields.emplace_back("status", std::to_string(result.GetFailure().http_status));
    }
    utils::LogInfo("dispatch", "request finished", std::move(fields));
    return result;
}

execution::ExecutionResult RequestDispatcher::Execute(const execution::ExecutionRequest& request,
                                                      std::chrono::steady_clock::time_point deadline,
                                                      const std::string& request_id) const {
    namespace failures = execution::failures;
    using execution::ExecutionResult;
    const auto request_timeout_s =
        std::chrono::duration_cast<std::chrono::seconds>(limits_.request_timeout).count();

    const auto* adapter = registry_.Get(request.GetLanguage());
    if (adapter == nullptr) {
        utils::LogError("dispatch", "no adapter registered",
                        {{"id", request_id}, {"language", execution::ToString(request.GetLanguage())}});
        return ExecutionResult::FromFailure(failures::Internal());
    }

    adapters::AdaptedUnit unit;
    try {
        unit = adapter->BuildAdaptedUnit(request.Code(), request.GetVizType());
    } catch (const std::exception& ex) {
        utils::LogError("dispatch", "adapter failed", {{"id", request_id}, {"error", ex.what()}});
        return ExecutionResult::FromFailure(failures::Internal());
    }

    auto admission = governor_.Admit(deadline);
    switch (admission.status) {
        case governor::AdmissionStatus::kRejected:
            return ExecutionResult::FromFailure(failures::CapacityExceeded());
        case governor::AdmissionStatus::kDeadlineExpired:
            return ExecutionResult::FromFailure(failures::Timeout(request_timeout_s));
        case governor::AdmissionStatus::kAdmitted:
            break;
    }

    const auto report = executor_.Run(unit, *admission.handle, deadline);
    return normalizer_.Normalize(unit, report);
}

}  // namespace vizrun::dispatch
