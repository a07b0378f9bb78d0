#pragma once

#include <cstddef>

#include "adapters/runtime_adapter.hpp"
#include "config/config_schema.hpp"
#include "execution/result.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace vizrun::output {

struct NormalizerLimits {
    std::size_t max_artifact_bytes = 20ull * 1024 * 1024;
    std::size_t max_diagnostic_bytes = 8192;
    std::size_t memory_mb = 1024;
    long long timeout_s = 30;
    long long request_timeout_s = 45;
};

NormalizerLimits MakeNormalizerLimits(const config::Config& config);

// Turns a raw worker report into the single client-facing result. Pure: the
// same report always yields the same result.
class OutputNormalizer {
public:
    explicit OutputNormalizer(NormalizerLimits limits);

    execution::ExecutionResult Normalize(const adapters::AdaptedUnit& unit,
                                         const sandbox::WorkerReport& report) const;

    const NormalizerLimits& Limits() const { return limits_; }

private:
    std::string Diagnostics(const sandbox::WorkerReport& report) const;
    bool ShowsMemoryExhaustion(const adapters::AdaptedUnit& unit,
                               const sandbox::WorkerReport& report) const;

    NormalizerLimits limits_;
};

}  // namespace vizrun::output
