#include "output/output_normalizer.hpp"

#include <signal.h>

#include <string>
#include <utility>

#include "utils/common.hpp"
#include "utils/encoding.hpp"
#include "utils/logging.hpp"

namespace vizrun::output {
namespace {

bool ContainsAny(const std::string& text, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        if (!marker.empty() && text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Signals that an allocation failure under RLIMIT_AS usually ends in.
bool IsAllocationFailureSignal(int signal) {
    return signal == SIGSEGV || signal == SIGABRT || signal == SIGBUS;
}

}  // namespace

NormalizerLimits MakeNormalizerLimits(const config::Config& config) {
    NormalizerLimits limits;
    limits.max_artifact_bytes = config.limits.max_artifact_bytes;
    limits.max_diagnostic_bytes = config.limits.max_diagnostic_bytes;
    limits.memory_mb = static_cast<std::size_t>(config.limits.memory_mb);
    limits.timeout_s = config.limits.timeout_s;
    limits.request_timeout_s = config.limits.request_timeout_s;
    return limits;
}

OutputNormalizer::OutputNormalizer(NormalizerLimits limits)
    : limits_(limits) {}

execution::ExecutionResult OutputNormalizer::Normalize(const adapters::AdaptedUnit& unit,
                                                       const sandbox::WorkerReport& report) const {
    using execution::ExecutionResult;
    namespace failures = execution::failures;
    using sandbox::KillReason;
    using sandbox::WorkerOutcome;

    if (report.outcome == WorkerOutcome::kSandboxError) {
        utils::LogError("normalizer", "sandbox fault", {{"error", report.internal_error}});
        return ExecutionResult::FromFailure(failures::Internal());
    }

    if (report.kill_reason == KillReason::kTimeout) {
        return ExecutionResult::FromFailure(failures::Timeout(limits_.timeout_s));
    }
    if (report.kill_reason == KillReason::kDeadline) {
        return ExecutionResult::FromFailure(failures::Timeout(limits_.request_timeout_s));
    }
    if (report.cpu_limit_reached || report.term_signal == SIGXCPU) {
        return ExecutionResult::FromFailure(failures::Timeout(limits_.timeout_s));
    }

    if (report.kill_reason == KillReason::kMemory || ShowsMemoryExhaustion(unit, report)) {
        return ExecutionResult::FromFailure(failures::MemoryExceeded(limits_.memory_mb));
    }

    if (report.kill_reason == KillReason::kCancelled) {
        utils::LogError("normalizer", "worker cancelled", {{"pid", std::to_string(report.pid)}});
        return ExecutionResult::FromFailure(failures::Internal());
    }

    if (report.term_signal == SIGXFSZ) {
        return ExecutionResult::FromFailure(failures::OutputTooLarge(limits_.max_artifact_bytes));
    }

    if (report.outcome != WorkerOutcome::kCompleted || report.exit_code != 0) {
        return ExecutionResult::FromFailure(failures::Runtime(Diagnostics(report)));
    }

    if (report.artifact_oversized || report.artifact_size > limits_.max_artifact_bytes) {
        return ExecutionResult::FromFailure(failures::OutputTooLarge(limits_.max_artifact_bytes));
    }

    if (!report.artifact || report.artifact->empty()
        || utils::Trim(*report.artifact) == adapters::kNoArtifactSentinel) {
        if (ContainsAny(report.stderr_text, unit.error_markers)) {
            return ExecutionResult::FromFailure(failures::Runtime(Diagnostics(report)));
        }
        return ExecutionResult::FromFailure(failures::NoOutput());
    }

    execution::Artifact artifact;
    artifact.kind = unit.artifact_kind;
    if (unit.artifact_kind == execution::ArtifactKind::kImage) {
        artifact.content = utils::EncodeBase64(*report.artifact);
    } else {
        artifact.content = *report.artifact;
    }
    return ExecutionResult::FromArtifact(std::move(artifact));
}

std::string OutputNormalizer::Diagnostics(const sandbox::WorkerReport& report) const {
    const bool use_stderr = !utils::Trim(report.stderr_text).empty();
    const auto text = utils::Trim(use_stderr ? report.stderr_text : report.stdout_text);
    const bool truncated = use_stderr ? report.stderr_truncated : report.stdout_truncated;
    if (truncated && text.size() <= limits_.max_diagnostic_bytes) {
        return "...(truncated)...\n" + text;
    }
    return utils::TruncateTail(text, limits_.max_diagnostic_bytes);
}

bool OutputNormalizer::ShowsMemoryExhaustion(const adapters::AdaptedUnit& unit,
                                             const sandbox::WorkerReport& report) const {
    if (report.outcome == sandbox::WorkerOutcome::kCompleted && report.exit_code == 0) {
        return false;
    }
    if (ContainsAny(report.stderr_text, unit.memory_markers)) {
        return true;
    }
    if (report.outcome != sandbox::WorkerOutcome::kCrashed) {
        return false;
    }
    // Nothing here sends an unprompted SIGKILL; the kernel OOM killer does.
    if (report.term_signal == SIGKILL) {
        return true;
    }
    const auto ceiling = limits_.memory_mb * 1024 * 1024;
    return IsAllocationFailureSignal(report.term_signal)
        && report.peak_rss_bytes >= ceiling / 10 * 9;
}

}  // namespace vizrun::output
