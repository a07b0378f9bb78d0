#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "adapters/runtime_adapter.hpp"
#include "config/config_schema.hpp"
#include "governor/resource_governor.hpp"

namespace vizrun::sandbox {

struct SandboxLimits {
    std::filesystem::path scratch_root;
    // Private namespaces and a read-only root for every worker.
    bool isolate = true;
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    std::vector<std::string> pass_env;
    std::vector<std::string> read_only_paths = {"/usr", "/bin", "/lib", "/lib64", "/etc"};
    std::size_t max_file_bytes = 64ull * 1024 * 1024;
    int max_open_files = 256;
    int max_processes = 256;
    std::size_t max_artifact_bytes = 20ull * 1024 * 1024;
    std::size_t max_capture_bytes = 8192;
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds kill_grace{500};
};

SandboxLimits MakeSandboxLimits(const config::Config& config);

enum class WorkerOutcome {
    kCompleted,
    kTimedOut,
    kCrashed,
    kKilled,
    // Spawn failure or another fault of the sandbox itself, never user code.
    kSandboxError
};

enum class KillReason {
    kNone,
    kTimeout,
    kDeadline,
    kMemory,
    kCancelled
};

const char* ToString(WorkerOutcome outcome);
const char* ToString(KillReason reason);

// Raw result of one worker run; interpretation belongs to the normalizer.
struct WorkerReport {
    WorkerOutcome outcome = WorkerOutcome::kSandboxError;
    KillReason kill_reason = KillReason::kNone;
    int pid = -1;
    int exit_code = -1;
    int term_signal = 0;
    // Tails of the captured streams, at most max_capture_bytes each.
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    // Present only when the process exited on its own and the channel was
    // written within the size bound.
    std::optional<std::string> artifact;
    std::size_t artifact_size = 0;
    bool artifact_oversized = false;
    // Summed over the worker's process tree.
    std::size_t peak_rss_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds cpu_time{0};
    // The CPU rlimit ended the run, by SIGXCPU or by the kill at the hard limit.
    bool cpu_limit_reached = false;
    std::string internal_error;
};

class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxLimits limits);

    // Runs the unit to completion or forced termination. Every process of the
    // worker is gone and the scratch directory removed before this returns;
    // the handle is finished with the matching terminal state.
    WorkerReport Run(const adapters::AdaptedUnit& unit,
                     governor::WorkerHandle& handle,
                     std::chrono::steady_clock::time_point deadline) const;

    const SandboxLimits& Limits() const { return limits_; }

private:
    WorkerReport Execute(const adapters::AdaptedUnit& unit,
                         governor::WorkerHandle& handle,
                         std::chrono::steady_clock::time_point deadline) const;

    SandboxLimits limits_;
};

}  // namespace vizrun::sandbox
