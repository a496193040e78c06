#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

/**
 * One-shot shutdown signal shared by a transport and its pump.
 *
 * Starts armed; signal() moves it to signalled exactly once. There is no
 * way back: a signalled transport is finished for good.
 */
class CancellationController {
public:
    using Slot = std::function<void()>;

    /// Returns true only for the call that performed the transition.
    bool signal();

    [[nodiscard]] bool signalled() const noexcept {
        return signalled_.load(std::memory_order_acquire);
    }

    /// Run slot once when signalled; runs it right away if that already happened.
    void on_signal(Slot slot);

private:
    std::atomic<bool> signalled_{false};
    std::mutex mutex_;
    std::vector<Slot> slots_;
};
