/**
 * CancellationController - One-shot stop signal shared by an owner and its pump.
 *
 * Slots registered with on_signal() run exactly once, on the thread that
 * signals (or immediately if the signal already happened).
 */

#include "network/cancellation.h"

bool CancellationController::signal() {
    std::vector<Slot> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (signalled_.load(std::memory_order_relaxed)) {
            return false;
        }
        signalled_.store(true, std::memory_order_release);
        slots.swap(slots_);
    }

    // Slots run outside the lock so they may call back into the controller.
    for (auto& slot : slots) {
        slot();
    }
    return true;
}

void CancellationController::on_signal(Slot slot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!signalled_.load(std::memory_order_relaxed)) {
            slots_.push_back(std::move(slot));
            return;
        }
    }
    slot();
}
