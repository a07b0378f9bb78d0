#include "governor/resource_governor.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace vizrun::governor {

const char* ToString(WorkerState state) {
    switch (state) {
        case WorkerState::kAdmitted:
            return "admitted";
        case WorkerState::kRunning:
            return "running";
        case WorkerState::kCompleted:
            return "completed";
        case WorkerState::kTimedOut:
            return "timed_out";
        case WorkerState::kCrashed:
            return "crashed";
        case WorkerState::kKilled:
            return "killed";
    }
    return "crashed";
}

std::optional<AdmissionPolicy> ParseAdmissionPolicy(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "reject") {
        return AdmissionPolicy::kReject;
    }
    if (lowered == "queue") {
        return AdmissionPolicy::kQueue;
    }
    return std::nullopt;
}

WorkerHandle::WorkerHandle(ResourceGovernor& governor, std::uint64_t id, WorkerCeilings ceilings)
    : governor_(governor)
    , id_(id)
    , ceilings_(ceilings)
    , admitted_at_(std::chrono::steady_clock::now()) {}

WorkerHandle::~WorkerHandle() {
    governor_.Release(*this, WorkerState::kCrashed);
}

void WorkerHandle::MarkRunning(pid_t pid) {
    pid_.store(pid);
    state_.store(WorkerState::kRunning);
}

void WorkerHandle::Finish(WorkerState terminal) {
    governor_.Release(*this, terminal);
}

ResourceGovernor::ResourceGovernor(GovernorLimits limits)
    : limits_(limits) {
    if (limits_.max_workers == 0) {
        limits_.max_workers = 1;
    }
    counters_.capacity = limits_.max_workers;
}

Admission ResourceGovernor::Admit(std::chrono::steady_clock::time_point deadline) {
    Admission admission{};
    std::unique_lock<std::mutex> lock(mutex_);
    if (!shutting_down_ && live_ >= limits_.max_workers && limits_.policy == AdmissionPolicy::kQueue) {
        const bool freed = slot_freed_.wait_until(lock, deadline, [this] {
            return shutting_down_ || live_ < limits_.max_workers;
        });
        if (!freed) {
            ++counters_.rejected;
            admission.status = AdmissionStatus::kDeadlineExpired;
            return admission;
        }
    }
    if (shutting_down_ || live_ >= limits_.max_workers) {
        ++counters_.rejected;
        admission.status = AdmissionStatus::kRejected;
        return admission;
    }

    ++live_;
    ++counters_.admitted;
    admission.handle.reset(new WorkerHandle(*this, next_id_++, limits_.ceilings));
    handles_.insert(admission.handle.get());
    admission.status = AdmissionStatus::kAdmitted;
    return admission;
}

void ResourceGovernor::Release(WorkerHandle& handle, WorkerState terminal) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle.released_) {
            return;
        }
        handle.released_ = true;
        handle.state_.store(terminal);
        handles_.erase(&handle);
        --live_;
        switch (terminal) {
            case WorkerState::kCompleted:
                ++counters_.completed;
                break;
            case WorkerState::kTimedOut:
                ++counters_.timed_out;
                break;
            case WorkerState::kKilled:
                ++counters_.killed;
                break;
            case WorkerState::kAdmitted:
            case WorkerState::kRunning:
            case WorkerState::kCrashed:
                ++counters_.crashed;
                break;
        }
    }
    slot_freed_.notify_one();
}

void ResourceGovernor::Shutdown() {
    std::size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto* handle : handles_) {
            handle->Token().Cancel();
            ++cancelled;
        }
    }
    slot_freed_.notify_all();
    utils::LogInfo("governor", "shutdown", {{"cancelled_workers", std::to_string(cancelled)}});
}

std::size_t ResourceGovernor::LiveWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

GovernorStats ResourceGovernor::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stats = counters_;
    stats.live = live_;
    return stats;
}

}  // namespace vizrun::governor
