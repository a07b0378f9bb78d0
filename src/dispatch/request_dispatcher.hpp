#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "adapters/adapter_registry.hpp"
#include "config/config_schema.hpp"
#include "execution/request.hpp"
#include "execution/result.hpp"
#include "governor/resource_governor.hpp"
#include "output/output_normalizer.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace vizrun::dispatch {

struct DispatcherLimits {
    std::size_t max_code_length = 100000;
    std::chrono::milliseconds request_timeout{45000};
};

DispatcherLimits MakeDispatcherLimits(const config::Config& config);

struct ValidationOutcome {
    std::optional<execution::ExecutionRequest> request;
    execution::Failure failure;

    bool Ok() const { return request.has_value(); }
};

// Entry point for one visualization request. Holds references only; every
// collaborator must outlive the dispatcher.
class RequestDispatcher {
public:
    RequestDispatcher(DispatcherLimits limits,
                      const adapters::AdapterRegistry& registry,
                      governor::ResourceGovernor& governor,
                      const sandbox::SandboxExecutor& executor,
                      const output::OutputNormalizer& normalizer);

    ValidationOutcome Validate(const execution::VisualizationRequest& request) const;

    // Never throws; every failure comes back as a Failure result.
    execution::ExecutionResult Dispatch(const execution::VisualizationRequest& request) const;

    const DispatcherLimits& Limits() const { return limits_; }

private:
    execution::ExecutionResult Execute(const execution::ExecutionRequest& request,
                                       std::chrono::steady_clock::time_point deadline,
                                       const std::string& request_id) const;

    DispatcherLimits limits_;
    const adapters::AdapterRegistry& registry_;
    governor::ResourceGovernor& governor_;
    const sandbox::SandboxExecutor& executor_;
    const output::OutputNormalizer& normalizer_;
};

}  // namespace vizrun::dispatch
