#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "net/auth_context.hpp"
#include "net/http.hpp"

struct credentials {
    std::string username;
    std::string password;
};

struct auth_settings {
    std::string realm_base;    // requests resolving under this prefix hit the login realm
    std::string token_url;     // password grant endpoint
    std::string authorize_url; // interactive login entry point
    std::string redirect_uri;
    std::string client_id;
    std::string client_secret; // empty for a public client
    std::string scope;
    std::string state;
    std::string protected_url; // fetched to verify a login
    std::string login_form_id;
    long connect_timeout_seconds;
    long read_timeout_seconds;

    auth_settings();
};

using session_factory = std::function<std::shared_ptr<http_session>()>;

class login_strategy {
public:
    virtual ~login_strategy() = default;

    virtual const char* name() const = 0;

    // Logs in on `session`. Returns the bearer token to send with later
    // requests (empty when the session cookies carry the identity), or nullopt.
    virtual std::optional<std::string> login(http_session& session) = 0;
};

// Resource owner password grant against the token endpoint.
class password_grant_login : public login_strategy {
public:
    password_grant_login(credentials creds, auth_settings settings);

    const char* name() const override {
        return "password grant";
    }
    std::optional<std::string> login(http_session& session) override;

private:
    credentials m_credentials;
    auth_settings m_settings;
};

// Walks the identity provider's browser login: fetch the login form, post the
// credentials with its hidden fields and follow the redirects back.
class browser_form_login : public login_strategy {
public:
    browser_form_login(credentials creds, auth_settings settings);

    const char* name() const override {
        return "browser form";
    }
    std::optional<std::string> login(http_session& session) override;

private:
    credentials m_credentials;
    auth_settings m_settings;
};

class authenticator : public auth_provider {
public:
    // Password grant first; the browser form login is added only for public
    // clients (no client secret).
    authenticator(const credentials& creds, const auth_settings& settings,
                  session_factory make_session);

    authenticator(const auth_settings& settings, session_factory make_session,
                  std::unique_ptr<login_strategy> direct,
                  std::unique_ptr<login_strategy> interactive);

    std::shared_ptr<const auth_context> establish(std::uint64_t generation) override;

private:
    auth_settings m_settings;
    session_factory m_make_session;
    std::unique_ptr<login_strategy> m_direct;
    std::unique_ptr<login_strategy> m_interactive;

    bool verify(http_session& session, const std::string& bearer_token);
};
