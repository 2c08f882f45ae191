#include "net/authenticated_transport.hpp"

#include "util/log.hpp"
#include "util/url_utils.hpp"

retry_policy::retry_policy()
    : max_attempts(10), base_delay(std::chrono::seconds(5)), max_jitter(std::chrono::seconds(1)) {}

authenticated_transport::authenticated_transport(auth_provider& provider, std::string realm_base,
                                                 retry_policy policy,
                                                 const cancellation_token& cancel,
                                                 sleep_function sleeper)
    : m_provider(provider), m_realm_base(std::move(realm_base)), m_policy(policy),
      m_cancel(cancel), m_sleep(std::move(sleeper)), m_jitter_engine(std::random_device{}()) {
    if (m_policy.max_attempts < 1) {
        m_policy.max_attempts = 1;
    }
    if (!m_sleep) {
        m_sleep = [this](std::chrono::milliseconds delay) { m_cancel.wait_for(delay); };
    }
}

bool authenticated_transport::initialize() {
    std::lock_guard<std::mutex> lk(m_replace_mutex);
    m_login_attempts.fetch_add(1, std::memory_order_relaxed);
    auto context = m_provider.establish(1);
    if (!context) {
        return false;
    }
    install(std::move(context));
    return true;
}

std::shared_ptr<const auth_context> authenticated_transport::current() const {
    return std::atomic_load(&m_context);
}

void authenticated_transport::install(std::shared_ptr<const auth_context> context) {
    std::atomic_store(&m_context, std::move(context));
}

authenticated_transport::failure_kind
authenticated_transport::classify(const http_response& head) const {
    if (!m_realm_base.empty() && url_utils::starts_with(head.effective_url, m_realm_base)) {
        return failure_kind::authorization;
    }
    switch (head.status_code) {
    case 401:
    case 403:
    case 503:
        return failure_kind::authorization;
    case 500:
    case 502:
    case 504:
        return failure_kind::server;
    default:
        return failure_kind::none;
    }
}

bool authenticated_transport::reauthenticate(std::uint64_t stale_generation) {
    std::lock_guard<std::mutex> lk(m_replace_mutex);
    auto context = current();
    std::uint64_t current_generation = context ? context->generation : 0;
    if (current_generation != stale_generation) {
        LOG_DEBUG("transport", "Session already refreshed (generation " << current_generation
                                                                        << "), retrying");
        return true;
    }

    m_login_attempts.fetch_add(1, std::memory_order_relaxed);
    auto fresh = m_provider.establish(stale_generation + 1);
    if (!fresh) {
        LOG_WARN("transport", "Re-login failed, will try the current session anyway.");
        return false;
    }
    install(std::move(fresh));
    LOG_INFO("transport", "Re-login successful (generation " << stale_generation + 1 << ").");
    return true;
}

std::chrono::milliseconds authenticated_transport::backoff(int attempt) {
    std::chrono::milliseconds jitter(0);
    if (m_policy.max_jitter.count() > 0) {
        std::lock_guard<std::mutex> lk(m_jitter_mutex);
        std::uniform_int_distribution<long long> dist(0, m_policy.max_jitter.count() - 1);
        jitter = std::chrono::milliseconds(dist(m_jitter_engine));
    }
    return m_policy.base_delay * attempt + jitter;
}

http_response authenticated_transport::request(const http_request& req,
                                               const body_router& route) {
    for (int attempt = 1; attempt <= m_policy.max_attempts; ++attempt) {
        m_cancel.throw_if_cancelled();

        auto context = current();
        if (!context) {
            throw std::logic_error("authenticated_transport used before initialize()");
        }

        http_request attempt_req = req;
        if (!context->bearer_token.empty()) {
            attempt_req.headers["Authorization"] = "Bearer " + context->bearer_token;
        }
        attempt_req.abort_check = [this, &req]() {
            return m_cancel.is_cancelled() || (req.abort_check && req.abort_check());
        };

        // Bytes handed to the caller cannot be taken back, so an exchange that
        // fails after delivering any of them is never replayed here.
        bool delivered = false;
        std::string reason;
        try {
            auto response = context->session->perform(
                attempt_req, [&](const http_response& head) -> body_sink {
                    if (classify(head) != failure_kind::none || !route) {
                        return nullptr;
                    }
                    body_sink sink = route(head);
                    if (!sink) {
                        return nullptr;
                    }
                    return [&delivered, sink](const char* data, std::size_t size) {
                        delivered = true;
                        return sink(data, size);
                    };
                });

            failure_kind failure = classify(response);
            if (failure == failure_kind::none) {
                return response;
            }
            if (failure == failure_kind::authorization) {
                if (response.status_code >= 200 && response.status_code < 300) {
                    LOG_WARN("transport", "Detected redirect to login page. Session expired.");
                }
                reason = "authorization failure (status " + std::to_string(response.status_code) +
                         ")";
            } else {
                reason = "server error (status " + std::to_string(response.status_code) + ")";
            }
        } catch (const http_error& e) {
            if (m_cancel.is_cancelled()) {
                throw operation_cancelled();
            }
            if (delivered || e.kind() == http_error_kind::aborted) {
                throw;
            }
            reason = std::string("connection unstable (") + to_string(e.kind()) + "): " + e.what();
        }

        LOG_WARN("transport", reason << " for " << req.url << ". Re-login/retry (" << attempt << "/"
                                     << m_policy.max_attempts << ")...");
        reauthenticate(context->generation);
        if (attempt < m_policy.max_attempts) {
            m_sleep(backoff(attempt));
        }
    }

    m_cancel.throw_if_cancelled();
    throw transport_exhausted_error("giving up on " + req.url + " after " +
                                    std::to_string(m_policy.max_attempts) + " attempts");
}
