#include "util/cancellation.hpp"

void cancellation_token::cancel() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_cancelled.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

void cancellation_token::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw operation_cancelled();
    }
}

bool cancellation_token::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lk(m_mutex);
    return !m_cv.wait_for(lk, duration, [this] { return is_cancelled(); });
}
