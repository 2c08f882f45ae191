#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

#include "net/auth_context.hpp"
#include "net/http.hpp"
#include "util/cancellation.hpp"

struct retry_policy {
    int max_attempts;
    std::chrono::milliseconds base_delay;
    std::chrono::milliseconds max_jitter;

    retry_policy();
};

class transport_exhausted_error : public std::runtime_error {
public:
    explicit transport_exhausted_error(const std::string& message)
        : std::runtime_error(message) {}
};

// Sends requests with the current authenticated identity and hides session
// expiry and flaky connections from the caller.
//
// Requests run concurrently against whatever context is current when they
// start. Replacing the context is serialized by one lock; callers that find
// the context already replaced since they saw it fail just retry, so a burst
// of failures costs a single login.
class authenticated_transport {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;

    enum class failure_kind {
        none,
        authorization, // 401/403/503 or bounced to the login realm
        server,        // other retryable 5xx
    };

    authenticated_transport(auth_provider& provider, std::string realm_base, retry_policy policy,
                            const cancellation_token& cancel, sleep_function sleeper = nullptr);

    authenticated_transport(const authenticated_transport&) = delete;
    authenticated_transport& operator=(const authenticated_transport&) = delete;

    // Establishes the first context. False means the credentials or the
    // portal are unusable.
    bool initialize();

    // Sends `req`, re-authenticating and retrying as needed. Responses that
    // are neither authorization nor server failures (2xx, 3xx, 4xx such as
    // 404 or 416) are returned as they are. `route` only ever sees the head
    // of such a response.
    http_response request(const http_request& req, const body_router& route = nullptr);

    // Replaces the context unless it has moved past `stale_generation`
    // already. Returns true when a usable newer context is installed.
    bool reauthenticate(std::uint64_t stale_generation);

    std::shared_ptr<const auth_context> current() const;

    failure_kind classify(const http_response& head) const;

    std::uint64_t login_attempts() const {
        return m_login_attempts.load(std::memory_order_relaxed);
    }

private:
    auth_provider& m_provider;
    std::string m_realm_base;
    retry_policy m_policy;
    const cancellation_token& m_cancel;
    sleep_function m_sleep;

    std::shared_ptr<const auth_context> m_context;
    std::mutex m_replace_mutex;
    std::atomic<std::uint64_t> m_login_attempts{0};

    std::mutex m_jitter_mutex;
    std::mt19937 m_jitter_engine;

    void install(std::shared_ptr<const auth_context> context);
    std::chrono::milliseconds backoff(int attempt);
};
