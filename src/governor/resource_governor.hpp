#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include <sys/types.h>

#include "sandbox/cancellation_token.hpp"

namespace vizrun::governor {

enum class WorkerState {
    kAdmitted,
    kRunning,
    kCompleted,
    kTimedOut,
    kCrashed,
    kKilled
};

const char* ToString(WorkerState state);

enum class AdmissionPolicy {
    kReject,
    kQueue
};

std::optional<AdmissionPolicy> ParseAdmissionPolicy(const std::string& value);

struct WorkerCeilings {
    std::chrono::milliseconds timeout{30000};
    std::size_t memory_bytes = 1024ull * 1024 * 1024;
};

struct GovernorLimits {
    std::size_t max_workers = 4;
    AdmissionPolicy policy = AdmissionPolicy::kReject;
    WorkerCeilings ceilings;
};

struct GovernorStats {
    std::size_t live = 0;
    std::size_t capacity = 0;
    std::uint64_t admitted = 0;
    std::uint64_t rejected = 0;
    std::uint64_t completed = 0;
    std::uint64_t timed_out = 0;
    std::uint64_t crashed = 0;
    std::uint64_t killed = 0;
};

class ResourceGovernor;

// One admitted worker. Holds a governor slot from admission until Finish() or
// destruction, whichever comes first; a worker still being set up counts
// against capacity like a running one. Must not outlive its governor.
class WorkerHandle {
public:
    ~WorkerHandle();

    WorkerHandle(const WorkerHandle&) = delete;
    WorkerHandle& operator=(const WorkerHandle&) = delete;

    std::uint64_t Id() const { return id_; }
    pid_t Pid() const { return pid_.load(); }
    std::chrono::steady_clock::time_point AdmittedAt() const { return admitted_at_; }
    const WorkerCeilings& Ceilings() const { return ceilings_; }
    sandbox::CancellationToken& Token() { return token_; }
    const sandbox::CancellationToken& Token() const { return token_; }
    WorkerState State() const { return state_.load(); }

    void MarkRunning(pid_t pid);
    // Records the terminal state and releases the slot. Later calls are ignored.
    void Finish(WorkerState terminal);

private:
    friend class ResourceGovernor;

    WorkerHandle(ResourceGovernor& governor, std::uint64_t id, WorkerCeilings ceilings);

    ResourceGovernor& governor_;
    std::uint64_t id_;
    WorkerCeilings ceilings_;
    std::chrono::steady_clock::time_point admitted_at_;
    sandbox::CancellationToken token_;
    std::atomic<pid_t> pid_{-1};
    std::atomic<WorkerState> state_{WorkerState::kAdmitted};
    bool released_ = false;  // guarded by the governor mutex
};

enum class AdmissionStatus {
    kAdmitted,
    kRejected,
    kDeadlineExpired
};

struct Admission {
    AdmissionStatus status = AdmissionStatus::kRejected;
    std::unique_ptr<WorkerHandle> handle;
};

class ResourceGovernor {
public:
    explicit ResourceGovernor(GovernorLimits limits);

    ResourceGovernor(const ResourceGovernor&) = delete;
    ResourceGovernor& operator=(const ResourceGovernor&) = delete;

    // Reject policy answers immediately; queue policy waits for a free slot
    // until the deadline.
    Admission Admit(std::chrono::steady_clock::time_point deadline);

    // Cancels every live worker and turns away queued and future admissions.
    void Shutdown();

    std::size_t LiveWorkers() const;
    std::size_t Capacity() const { return limits_.max_workers; }
    const GovernorLimits& Limits() const { return limits_; }
    GovernorStats Stats() const;

private:
    friend class WorkerHandle;

    void Release(WorkerHandle& handle, WorkerState terminal);

    GovernorLimits limits_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::size_t live_ = 0;
    std::uint64_t next_id_ = 1;
    bool shutting_down_ = false;
    std::unordered_set<WorkerHandle*> handles_;
    GovernorStats counters_;
};

}  // namespace vizrun::governor
