#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace vizrun::execution {

enum class ArtifactKind {
    kImage,
    kHtml
};

enum class FailureKind {
    kValidationError,
    kExecutionTimeout,
    kResourceExceeded,
    kRuntimeError,
    kNoOutput,
    kOutputTooLarge,
    kInternalError
};

const char* ToString(ArtifactKind kind);
const char* ToString(FailureKind kind);

struct Artifact {
    ArtifactKind kind = ArtifactKind::kImage;
    // Base64 PNG for images, the full document for html.
    std::string content;
};

struct Failure {
    FailureKind kind = FailureKind::kInternalError;
    std::string message;
    int http_status = 500;
};

constexpr const char* kNoVisualizationMessage = "No visualization was generated";
constexpr const char* kInternalErrorMessage = "Internal server error";

// Failure constructors carrying the client-facing message and HTTP status.
namespace failures {

Failure Validation(std::string message);
Failure Timeout(long long timeout_seconds);
Failure MemoryExceeded(std::size_t memory_mb);
Failure CapacityExceeded();
Failure Runtime(std::string diagnostics);
Failure NoOutput();
Failure OutputTooLarge(std::size_t max_bytes);
Failure Internal();

}  // namespace failures

class ExecutionResult {
public:
    static ExecutionResult FromArtifact(Artifact artifact);
    static ExecutionResult FromFailure(Failure failure);

    bool IsArtifact() const { return std::holds_alternative<Artifact>(value_); }
    bool IsFailure() const { return std::holds_alternative<Failure>(value_); }
    const Artifact& GetArtifact() const { return std::get<Artifact>(value_); }
    const Failure& GetFailure() const { return std::get<Failure>(value_); }

    // "image", "html" or the failure kind name, for log lines.
    std::string Describe() const;

private:
    explicit ExecutionResult(std::variant<Artifact, Failure> value)
        : value_(std::move(value)) {}

    std::variant<Artifact, Failure> value_;
};

}  // namespace vizrun::execution
