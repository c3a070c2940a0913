#pragma once

#include <atomic>

// Cooperative cancellation flag. cancel() only performs a lock-free store,
// so it may be called from a signal handler.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
