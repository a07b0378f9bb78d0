#pragma once

#include <atomic>

namespace vizrun::sandbox {

// Observed by the supervision loop on every poll; a cancelled worker is killed.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace vizrun::sandbox
