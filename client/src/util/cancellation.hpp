#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

class operation_cancelled : public std::runtime_error {
public:
    operation_cancelled() : std::runtime_error("cancelled") {}
};

// Shared stop flag. Cancellation is one-way; waiters are woken immediately.
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    cancellation_token& operator=(const cancellation_token&) = delete;

    void cancel();
    bool is_cancelled() const {
        return m_cancelled.load(std::memory_order_acquire);
    }
    void throw_if_cancelled() const;

    // Blocks for `duration` or until cancel() is called.
    // Returns false when woken by cancellation.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};
