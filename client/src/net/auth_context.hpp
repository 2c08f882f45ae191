#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "net/http.hpp"

// One authenticated identity: the session (cookie jar and DNS cache) the
// login ran on plus the bearer token, if the login produced one. Never
// modified after it has been published; re-authentication builds a new one.
struct auth_context {
    std::uint64_t generation;
    std::shared_ptr<http_session> session;
    std::string bearer_token;

    auth_context(std::uint64_t generation, std::shared_ptr<http_session> session,
                 std::string bearer_token)
        : generation(generation), session(std::move(session)),
          bearer_token(std::move(bearer_token)) {}
};

class auth_provider {
public:
    virtual ~auth_provider() = default;

    // Builds a fresh, verified context. Returns nullptr when every login
    // strategy failed.
    virtual std::shared_ptr<const auth_context> establish(std::uint64_t generation) = 0;
};
