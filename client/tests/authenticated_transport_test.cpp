#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <vector>

#include "fake_portal.hpp"
#include "net/authenticated_transport.hpp"
#include "net/authenticator.hpp"

using test_support::fake_portal;
using test_support::scripted_reply;
using namespace std::chrono_literals;

namespace {
class recording_sleeper {
public:
    authenticated_transport::sleep_function fn() {
        return [this](std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_delays.push_back(delay);
        };
    }

    std::vector<std::chrono::milliseconds> delays() {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_delays;
    }

private:
    std::mutex m_mutex;
    std::vector<std::chrono::milliseconds> m_delays;
};

retry_policy fast_policy(int attempts = 4) {
    retry_policy policy;
    policy.max_attempts = attempts;
    policy.base_delay = 10ms;
    policy.max_jitter = 0ms;
    return policy;
}

class TransportTest : public ::testing::Test {
protected:
    fake_portal portal;
    cancellation_token cancel;
    recording_sleeper sleeper;
    std::unique_ptr<authenticator> auth;
    std::unique_ptr<authenticated_transport> transport;

    void SetUp() override {
        portal.add_file("a.bin", "0123456789abcdefghijklmnopqrstuvwxyz");
    }

    void start(retry_policy policy = fast_policy()) {
        auth = std::make_unique<authenticator>(portal.user(), portal.settings(), portal.factory());
        transport = std::make_unique<authenticated_transport>(*auth, fake_portal::REALM_BASE,
                                                              policy, cancel, sleeper.fn());
        ASSERT_TRUE(transport->initialize());
    }

    // Streams the body of `url` into a string through the router.
    std::string stream(const std::string& url) {
        std::string received;
        auto response = transport->request(http_request(url), [&](const http_response&) {
            return [&](const char* data, std::size_t size) {
                received.append(data, size);
                return true;
            };
        });
        EXPECT_EQ(response.status_code, 200);
        return received;
    }
};
} // namespace

TEST_F(TransportTest, InitializeFailsWithBadCredentials) {
    portal.password = "changed";
    authenticator bad(credentials{portal.username, "old"}, portal.settings(), portal.factory());
    authenticated_transport t(bad, fake_portal::REALM_BASE, fast_policy(), cancel, sleeper.fn());
    EXPECT_FALSE(t.initialize());
    EXPECT_EQ(t.current(), nullptr);
}

TEST_F(TransportTest, AttachesBearerToken) {
    start();
    EXPECT_EQ(transport->current()->generation, 1u);
    EXPECT_EQ(stream(portal.url("a.bin")), "0123456789abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(transport->login_attempts(), 1u);
    EXPECT_TRUE(sleeper.delays().empty());
}

TEST_F(TransportTest, ExpiredSessionIsReplacedTransparently) {
    start();
    portal.expire_sessions();

    // The login page served for the expired session never reaches the sink
    EXPECT_EQ(stream(portal.url("a.bin")), "0123456789abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(transport->current()->generation, 2u);
    EXPECT_EQ(transport->login_attempts(), 2u);
    EXPECT_EQ(portal.token_grants.load(), 2);
}

TEST_F(TransportTest, ConcurrentFailuresCoalesceIntoOneLogin) {
    start();
    for (int i = 0; i < 16; ++i) {
        portal.add_file("f" + std::to_string(i), std::string(100 + i, 'x'));
    }
    portal.expire_sessions();

    std::vector<std::future<std::string>> workers;
    for (int i = 0; i < 16; ++i) {
        workers.push_back(std::async(std::launch::async, [this, i]() {
            return transport->request(http_request(portal.url("f" + std::to_string(i)))).body;
        }));
    }
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(workers[i].get(), std::string(100 + i, 'x'));
    }

    EXPECT_EQ(transport->login_attempts(), 2u);
    EXPECT_EQ(portal.token_grants.load(), 2);
    EXPECT_EQ(transport->current()->generation, 2u);
}

TEST_F(TransportTest, ReauthenticateSkipsWhenAlreadyReplaced) {
    start();
    EXPECT_TRUE(transport->reauthenticate(1));
    EXPECT_EQ(transport->current()->generation, 2u);
    EXPECT_TRUE(transport->reauthenticate(1));
    EXPECT_EQ(transport->current()->generation, 2u);
    EXPECT_EQ(transport->login_attempts(), 2u);
}

TEST_F(TransportTest, FailedReloginKeepsCurrentContext) {
    start();
    portal.password = "rotated";
    EXPECT_FALSE(transport->reauthenticate(1));
    EXPECT_EQ(transport->current()->generation, 1u);
}

TEST_F(TransportTest, ServerErrorsBackOffLinearly) {
    std::atomic<int> failures{2};
    portal.set_interceptor([&failures](const http_request& req) -> std::optional<scripted_reply> {
        if (req.url == fake_portal::DATA_BASE || failures.fetch_sub(1) <= 0)
            return std::nullopt;
        return scripted_reply::status(502, req.url, "bad gateway");
    });
    start();

    EXPECT_EQ(stream(portal.url("a.bin")), "0123456789abcdefghijklmnopqrstuvwxyz");
    auto delays = sleeper.delays();
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[0], 10ms);
    EXPECT_EQ(delays[1], 20ms);
}

TEST_F(TransportTest, GivesUpAfterMaxAttempts) {
    portal.set_interceptor([](const http_request& req) -> std::optional<scripted_reply> {
        if (req.url == fake_portal::DATA_BASE)
            return std::nullopt;
        return scripted_reply::status(500, req.url, "boom");
    });
    start(fast_policy(3));

    EXPECT_THROW(transport->request(http_request(portal.url("a.bin"))), transport_exhausted_error);
    EXPECT_EQ(sleeper.delays().size(), 2u);
}

TEST_F(TransportTest, OrdinaryStatusesAreReturned) {
    start();
    auto missing = transport->request(http_request(portal.url("missing.bin")));
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_TRUE(sleeper.delays().empty());

    http_request ranged(portal.url("a.bin"));
    ranged.headers["Range"] = "bytes=100-";
    auto unsatisfiable = transport->request(ranged);
    EXPECT_EQ(unsatisfiable.status_code, 416);
    EXPECT_EQ(unsatisfiable.header("content-range"), "bytes */36");
    EXPECT_EQ(transport->login_attempts(), 1u);
}

TEST_F(TransportTest, ConnectionErrorsBeforeBodyAreRetried) {
    std::atomic<int> failures{1};
    portal.set_interceptor([&failures](const http_request& req) -> std::optional<scripted_reply> {
        if (req.url == fake_portal::DATA_BASE || failures.fetch_sub(1) <= 0)
            return std::nullopt;
        return scripted_reply::failure(http_error_kind::timeout);
    });
    start();

    EXPECT_EQ(stream(portal.url("a.bin")), "0123456789abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(sleeper.delays().size(), 1u);
}

TEST_F(TransportTest, FailureAfterDeliveredBytesIsNotReplayed) {
    portal.set_interceptor([](const http_request& req) -> std::optional<scripted_reply> {
        if (req.url == fake_portal::DATA_BASE)
            return std::nullopt;
        auto reply = scripted_reply::status(200, req.url, std::string(64, 'z'));
        reply.fail_after = 20;
        return reply;
    });
    start();

    std::size_t received = 0;
    try {
        transport->request(http_request(portal.url("a.bin")), [&](const http_response&) {
            return [&](const char*, std::size_t size) {
                received += size;
                return true;
            };
        });
        FAIL() << "expected http_error";
    } catch (const http_error& e) {
        EXPECT_EQ(e.kind(), http_error_kind::connection_reset);
    }
    EXPECT_EQ(received, 20u);
    EXPECT_EQ(portal.data_requests.load(), 2); // verification plus the one attempt
    EXPECT_TRUE(sleeper.delays().empty());
}

TEST_F(TransportTest, CancelledTokenStopsRequests) {
    start();
    cancel.cancel();
    EXPECT_THROW(transport->request(http_request(portal.url("a.bin"))), operation_cancelled);
}

TEST_F(TransportTest, ClassifiesResponses) {
    start();
    http_response head;
    head.effective_url = portal.url("a.bin");

    head.status_code = 200;
    EXPECT_EQ(transport->classify(head), authenticated_transport::failure_kind::none);
    head.status_code = 416;
    EXPECT_EQ(transport->classify(head), authenticated_transport::failure_kind::none);
    for (int code : {401, 403, 503}) {
        head.status_code = code;
        EXPECT_EQ(transport->classify(head), authenticated_transport::failure_kind::authorization);
    }
    for (int code : {500, 502, 504}) {
        head.status_code = code;
        EXPECT_EQ(transport->classify(head), authenticated_transport::failure_kind::server);
    }

    head.status_code = 200;
    head.effective_url = std::string(fake_portal::REALM_BASE) + "/auth?client_id=x";
    EXPECT_EQ(transport->classify(head), authenticated_transport::failure_kind::authorization);
}

TEST_F(TransportTest, JitterStaysWithinBound) {
    retry_policy policy = fast_policy(5);
    policy.max_jitter = 7ms;
    portal.set_interceptor([](const http_request& req) -> std::optional<scripted_reply> {
        if (req.url == fake_portal::DATA_BASE)
            return std::nullopt;
        return scripted_reply::status(504, req.url);
    });
    start(policy);

    EXPECT_THROW(transport->request(http_request(portal.url("a.bin"))), transport_exhausted_error);
    auto delays = sleeper.delays();
    ASSERT_EQ(delays.size(), 4u);
    for (std::size_t i = 0; i < delays.size(); ++i) {
        auto base = 10ms * static_cast<int>(i + 1);
        EXPECT_GE(delays[i], base);
        EXPECT_LT(delays[i], base + 7ms);
    }
}
