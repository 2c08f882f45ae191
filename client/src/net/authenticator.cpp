#include "net/authenticator.hpp"

#include <nlohmann/json.hpp>

#include "net/login_page.hpp"
#include "util/log.hpp"
#include "util/url_utils.hpp"

namespace {
http_request make_request(const auth_settings& settings, const std::string& url,
                          const std::string& method = "GET") {
    http_request req(url, method);
    req.connect_timeout_seconds = settings.connect_timeout_seconds;
    req.read_timeout_seconds = settings.read_timeout_seconds;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    req.headers["Accept-Language"] = "en-US,en;q=0.5";
    return req;
}

http_request make_form_post(const auth_settings& settings, const std::string& url,
                            const url_utils::field_list& fields) {
    http_request req = make_request(settings, url, "POST");
    req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    req.body = url_utils::form_encode(fields);
    return req;
}

std::string abbreviate(const std::string& text, size_t limit = 300) {
    if (text.size() <= limit)
        return text;
    return text.substr(0, limit) + "...";
}
} // namespace

auth_settings::auth_settings()
    : scope("openid email"), state("12345"), login_form_id("kc-form-login"),
      connect_timeout_seconds(15), read_timeout_seconds(60) {}

password_grant_login::password_grant_login(credentials creds, auth_settings settings)
    : m_credentials(std::move(creds)), m_settings(std::move(settings)) {}

std::optional<std::string> password_grant_login::login(http_session& session) {
    url_utils::field_list payload = {
        {"client_id", m_settings.client_id},
        {"username", m_credentials.username},
        {"password", m_credentials.password},
        {"grant_type", "password"},
    };
    if (!m_settings.client_secret.empty()) {
        payload.emplace_back("client_secret", m_settings.client_secret);
    }

    http_request req = make_form_post(m_settings, m_settings.token_url, payload);
    req.headers["Accept"] = "application/json";
    try {
        auto response = session.perform(req);
        if (response.status_code != 200) {
            LOG_WARN("auth", "Direct login failed (status " << response.status_code
                                                             << "): " << abbreviate(response.body));
            return std::nullopt;
        }

        nlohmann::json json = nlohmann::json::parse(response.body);
        if (!json.contains("access_token") || !json["access_token"].is_string()) {
            LOG_WARN("auth", "Token response carries no access_token");
            return std::nullopt;
        }
        std::string token = json["access_token"].get<std::string>();
        if (token.empty()) {
            LOG_WARN("auth", "Token response carries an empty access_token");
            return std::nullopt;
        }
        return token;
    } catch (const std::exception& e) {
        LOG_WARN("auth", "Direct login error: " << e.what());
        return std::nullopt;
    }
}

browser_form_login::browser_form_login(credentials creds, auth_settings settings)
    : m_credentials(std::move(creds)), m_settings(std::move(settings)) {}

std::optional<std::string> browser_form_login::login(http_session& session) {
    try {
        // Step 1: Get the login page
        std::string url = url_utils::with_query(m_settings.authorize_url,
                                                {
                                                    {"response_type", "code"},
                                                    {"client_id", m_settings.client_id},
                                                    {"redirect_uri", m_settings.redirect_uri},
                                                    {"scope", m_settings.scope},
                                                    {"state", m_settings.state},
                                                });
        auto page = session.perform(make_request(m_settings, url));
        raise_for_status(page);

        // Step 2: Locate the form; without one the session may already be valid
        auto form = login_page::find_login_form(page.body, m_settings.login_form_id);
        if (!form) {
            LOG_INFO("auth", "Could not find login form. Checking if already authenticated...");
            return std::string();
        }

        std::string action_url = form->action.empty()
                                     ? page.effective_url
                                     : url_utils::resolve(page.effective_url, form->action);

        // Step 3: Post credentials plus the hidden fields, following the redirect
        // chain back to the application
        url_utils::field_list fields = {
            {"username", m_credentials.username},
            {"password", m_credentials.password},
            {"credentialId", ""},
        };
        for (const auto& hidden : form->hidden_fields) {
            fields.push_back(hidden);
        }

        http_request post = make_form_post(m_settings, action_url, fields);
        post.headers["Referer"] = page.effective_url;
        auto result = session.perform(post);

        if (auto error = login_page::find_login_error(result.body)) {
            LOG_WARN("auth", "Login Error: " << *error);
            return std::nullopt;
        }
        return std::string();
    } catch (const std::exception& e) {
        LOG_WARN("auth", "Browser flow error: " << e.what());
        return std::nullopt;
    }
}

authenticator::authenticator(const credentials& creds, const auth_settings& settings,
                             session_factory make_session)
    : m_settings(settings), m_make_session(std::move(make_session)),
      m_direct(std::make_unique<password_grant_login>(creds, settings)) {
    if (settings.client_secret.empty()) {
        m_interactive = std::make_unique<browser_form_login>(creds, settings);
    }
}

authenticator::authenticator(const auth_settings& settings, session_factory make_session,
                             std::unique_ptr<login_strategy> direct,
                             std::unique_ptr<login_strategy> interactive)
    : m_settings(settings), m_make_session(std::move(make_session)), m_direct(std::move(direct)),
      m_interactive(std::move(interactive)) {}

std::shared_ptr<const auth_context> authenticator::establish(std::uint64_t generation) {
    // Each attempt starts from a clean cookie jar
    std::shared_ptr<http_session> session = m_make_session();

    if (m_direct) {
        LOG_INFO("auth", "Attempting direct login with client_id='" << m_settings.client_id
                                                                   << "'...");
        auto token = m_direct->login(*session);
        if (token && verify(*session, *token)) {
            LOG_INFO("auth", "Direct login successful.");
            return std::make_shared<const auth_context>(generation, session, *token);
        }
    }

    if (!m_interactive) {
        return nullptr;
    }

    LOG_INFO("auth", "Direct login failed. Attempting " << m_interactive->name() << " flow...");
    session = m_make_session();
    auto token = m_interactive->login(*session);
    if (token && verify(*session, *token)) {
        return std::make_shared<const auth_context>(generation, session, *token);
    }
    return nullptr;
}

bool authenticator::verify(http_session& session, const std::string& bearer_token) {
    http_request req = make_request(m_settings, m_settings.protected_url);
    if (!bearer_token.empty()) {
        req.headers["Authorization"] = "Bearer " + bearer_token;
    }
    try {
        auto response = session.perform(req);
        bool at_realm = !m_settings.realm_base.empty() &&
                        url_utils::starts_with(response.effective_url, m_settings.realm_base);
        if (response.status_code == 200 && !at_realm) {
            LOG_INFO("auth", "Authentication verified.");
            return true;
        }
        LOG_WARN("auth", "Authentication verification failed. Status code: "
                             << response.status_code << " (" << response.effective_url << ")");
        return false;
    } catch (const std::exception& e) {
        LOG_WARN("auth", "Auth check error: " << e.what());
        return false;
    }
}
