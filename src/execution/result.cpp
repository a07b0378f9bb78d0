#include "execution/result.hpp"

#include <utility>

namespace vizrun::execution {

const char* ToString(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::kImage:
            return "image";
        case ArtifactKind::kHtml:
            return "html";
    }
    return "image";
}

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kValidationError:
            return "ValidationError";
        case FailureKind::kExecutionTimeout:
            return "ExecutionTimeout";
        case FailureKind::kResourceExceeded:
            return "ResourceExceeded";
        case FailureKind::kRuntimeError:
            return "RuntimeError";
        case FailureKind::kNoOutput:
            return "NoOutput";
        case FailureKind::kOutputTooLarge:
            return "OutputTooLarge";
        case FailureKind::kInternalError:
            return "InternalError";
    }
    return "InternalError";
}

namespace failures {

Failure Validation(std::string message) {
    return {FailureKind::kValidationError, std::move(message), 400};
}

Failure Timeout(long long timeout_seconds) {
    return {FailureKind::kExecutionTimeout,
            "Execution timed out after " + std::to_string(timeout_seconds) + " seconds",
            408};
}

Failure MemoryExceeded(std::size_t memory_mb) {
    return {FailureKind::kResourceExceeded,
            "Execution exceeded the memory limit of " + std::to_string(memory_mb) + " MB",
            422};
}

Failure CapacityExceeded() {
    return {FailureKind::kResourceExceeded, "Server is at capacity, please retry later", 429};
}

Failure Runtime(std::string diagnostics) {
    if (diagnostics.empty()) {
        diagnostics = "Execution failed without diagnostic output";
    }
    return {FailureKind::kRuntimeError, std::move(diagnostics), 422};
}

Failure NoOutput() {
    return {FailureKind::kNoOutput, kNoVisualizationMessage, 422};
}

Failure OutputTooLarge(std::size_t max_bytes) {
    return {FailureKind::kOutputTooLarge,
            "Generated visualization exceeds the maximum size of " + std::to_string(max_bytes) + " bytes",
            413};
}

Failure Internal() {
    return {FailureKind::kInternalError, kInternalErrorMessage, 500};
}

}  // namespace failures

ExecutionResult ExecutionResult::FromArtifact(Artifact artifact) {
    return ExecutionResult(std::move(artifact));
}

ExecutionResult ExecutionResult::FromFailure(Failure failure) {
    return ExecutionResult(std::move(failure));
}

std::string ExecutionResult::Describe() const {
    if (IsArtifact()) {
        return ToString(GetArtifact().kind);
    }
    return ToString(GetFailure().kind);
}

}  // namespace vizrun::execution
