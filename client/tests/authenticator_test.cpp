#include <gtest/gtest.h>

#include "fake_portal.hpp"
#include "net/authenticator.hpp"

using test_support::fake_portal;
using test_support::scripted_reply;
using test_support::scripted_session;

namespace {
class counting_strategy : public login_strategy {
public:
    explicit counting_strategy(std::optional<std::string> result) : m_result(std::move(result)) {}

    const char* name() const override {
        return "counting";
    }
    std::optional<std::string> login(http_session&) override {
        ++calls;
        return m_result;
    }

    int calls = 0;

private:
    std::optional<std::string> m_result;
};
} // namespace

TEST(Authenticator, PasswordGrantProducesBearerContext) {
    fake_portal portal;
    authenticator auth(portal.user(), portal.settings(), portal.factory());

    auto context = auth.establish(1);
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(context->generation, 1u);
    EXPECT_EQ(context->bearer_token, "token-1");
    EXPECT_EQ(portal.token_grants.load(), 1);
    EXPECT_EQ(portal.form_logins.load(), 0);
}

TEST(Authenticator, FallsBackToBrowserLoginWhenGrantRefused) {
    fake_portal portal;
    portal.password_grant_enabled = false;
    authenticator auth(portal.user(), portal.settings(), portal.factory());

    auto context = auth.establish(3);
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(context->generation, 3u);
    EXPECT_TRUE(context->bearer_token.empty());
    EXPECT_EQ(portal.form_logins.load(), 1);

    // The cookie jar of the login session carries the identity
    auto page = context->session->perform(http_request(portal.url("")));
    EXPECT_EQ(page.status_code, 200);
    EXPECT_EQ(page.effective_url, fake_portal::DATA_BASE);
}

TEST(Authenticator, WrongPasswordFailsBothStrategies) {
    fake_portal portal;
    credentials wrong{portal.username, "nope"};
    authenticator auth(wrong, portal.settings(), portal.factory());

    EXPECT_EQ(auth.establish(1), nullptr);
    EXPECT_EQ(portal.token_grants.load(), 0);
    EXPECT_EQ(portal.form_logins.load(), 0);
}

TEST(Authenticator, ConfidentialClientHasNoBrowserFallback) {
    fake_portal portal;
    portal.password_grant_enabled = false;
    auto settings = portal.settings();
    settings.client_secret = "shh";
    authenticator auth(portal.user(), settings, portal.factory());

    EXPECT_EQ(auth.establish(1), nullptr);
    EXPECT_EQ(portal.form_logins.load(), 0);
}

TEST(Authenticator, TokenThatDoesNotUnlockDataIsRejected) {
    fake_portal portal;
    // Every data request lands on the login page, so verification must fail
    portal.set_interceptor([](const http_request&) -> std::optional<scripted_reply> {
        return scripted_reply::status(200, std::string(fake_portal::REALM_BASE) + "/auth",
                                      "<form id=\"kc-form-login\"></form>");
    });
    auto settings = portal.settings();
    auto direct = std::make_unique<counting_strategy>(std::string("forged"));
    auto* direct_ptr = direct.get();
    authenticator auth(settings, portal.factory(), std::move(direct), nullptr);

    EXPECT_EQ(auth.establish(1), nullptr);
    EXPECT_EQ(direct_ptr->calls, 1);
}

TEST(Authenticator, InteractiveStrategyRunsOnFreshSession) {
    int sessions = 0;
    auto factory = [&sessions]() -> std::shared_ptr<http_session> {
        ++sessions;
        return std::make_shared<scripted_session>([](const http_request& req) {
            return scripted_reply::status(200, req.url, "ok");
        });
    };
    auto direct = std::make_unique<counting_strategy>(std::nullopt);
    auto interactive = std::make_unique<counting_strategy>(std::string());
    auto* direct_ptr = direct.get();
    auto* interactive_ptr = interactive.get();

    auth_settings settings;
    settings.realm_base = "https://auth.test/realms/eog";
    settings.protected_url = "https://data.test/files/";
    authenticator auth(settings, factory, std::move(direct), std::move(interactive));

    auto context = auth.establish(2);
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(direct_ptr->calls, 1);
    EXPECT_EQ(interactive_ptr->calls, 1);
    EXPECT_EQ(sessions, 2);
}

TEST(Authenticator, BrowserLoginReportsRejection) {
    fake_portal portal;
    browser_form_login login(credentials{portal.username, "bad"}, portal.settings());
    auto session = portal.new_session();
    EXPECT_FALSE(login.login(*session).has_value());
    EXPECT_EQ(portal.form_logins.load(), 0);
}

TEST(Authenticator, BrowserLoginWithoutFormDefersToVerification) {
    auth_settings settings;
    settings.authorize_url = "https://auth.test/auth";
    scripted_session session([](const http_request& req) {
        return scripted_reply::status(200, "https://data.test/files/", "already signed in");
    });
    browser_form_login login(credentials{"u", "p"}, settings);
    auto token = login.login(session);
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(token->empty());
    EXPECT_EQ(session.requests.load(), 1);
}

TEST(Authenticator, BrowserLoginFailsWhenLoginPageErrors) {
    auth_settings settings;
    settings.authorize_url = "https://auth.test/auth";
    scripted_session session([](const http_request& req) {
        return scripted_reply::status(502, req.url, "bad gateway");
    });
    browser_form_login login(credentials{"u", "p"}, settings);
    EXPECT_FALSE(login.login(session).has_value());
}

TEST(Authenticator, PasswordGrantRejectsMalformedTokenResponse) {
    auth_settings settings;
    settings.token_url = "https://auth.test/token";
    scripted_session session([](const http_request& req) {
        return scripted_reply::status(200, req.url, "{\"token_type\":\"Bearer\"}");
    });
    password_grant_login login(credentials{"u", "p"}, settings);
    EXPECT_FALSE(login.login(session).has_value());

    scripted_session garbage([](const http_request& req) {
        return scripted_reply::status(200, req.url, "<html>not json</html>");
    });
    EXPECT_FALSE(login.login(garbage).has_value());
}

TEST(Authenticator, PasswordGrantSendsClientSecretWhenConfigured) {
    auth_settings settings;
    settings.token_url = "https://auth.test/token";
    settings.client_id = "cid";
    settings.client_secret = "s e";
    std::string posted;
    scripted_session session([&posted](const http_request& req) {
        posted = req.body;
        return scripted_reply::status(200, req.url, "{\"access_token\":\"abc\"}");
    });
    password_grant_login login(credentials{"u@x", "p"}, settings);
    auto token = login.login(session);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(*token, "abc");
    EXPECT_EQ(posted, "client_id=cid&username=u%40x&password=p&grant_type=password&client_secret=s%20e");
}
