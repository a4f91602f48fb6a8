#pragma once
#include <mutex>
#include <optional>
#include <utility>

namespace karltui {

// Single-slot hand-off from a worker thread to the event loop.
// The worker posts once; the loop polls without blocking.
template<typename T>
class Mailbox {
public:
    void post(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = std::move(value);
    }

    // Returns the posted value once, then nullopt.
    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> out = std::move(slot_);
        slot_.reset();
        return out;
    }

private:
    std::mutex mutex_;
    std::optional<T> slot_;
};

} // namespace karltui
