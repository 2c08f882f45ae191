#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

struct http_response {
    int status_code;
    std::string effective_url;
    std::string body;
    std::map<std::string, std::string> headers; // names are lower-cased

    http_response() : status_code(0) {}

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

struct http_request {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    bool follow_redirects;
    long connect_timeout_seconds;
    long read_timeout_seconds;
    // Polled while the exchange is in progress; returning true aborts it.
    std::function<bool()> abort_check;

    explicit http_request(const std::string& url, const std::string& method = "GET")
        : method(method), url(url), follow_redirects(true), connect_timeout_seconds(15),
          read_timeout_seconds(60) {}
};

// Receives body bytes. Returning false stops the transfer without error.
using body_sink = std::function<bool(const char* data, std::size_t size)>;

// Chooses where the body goes once the final response head is known.
// An empty sink collects the body into http_response::body.
using body_router = std::function<body_sink(const http_response& head)>;

enum class http_error_kind {
    connect,
    timeout,
    connection_reset,
    truncated,
    aborted,
    other,
};

class http_error : public std::runtime_error {
public:
    http_error(http_error_kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    http_error_kind kind() const {
        return m_kind;
    }

private:
    http_error_kind m_kind;
};

class http_status_error : public std::runtime_error {
public:
    http_status_error(int status_code, const std::string& url)
        : std::runtime_error("http status " + std::to_string(status_code) + " for " + url),
          m_status_code(status_code) {}

    int status_code() const {
        return m_status_code;
    }

private:
    int m_status_code;
};

const char* to_string(http_error_kind kind);

// Throws http_status_error for 4xx and 5xx responses.
void raise_for_status(const http_response& response);

// One cookie jar and DNS cache. perform() may be called from several threads
// at once.
class http_session {
public:
    virtual ~http_session() = default;

    // Runs one exchange (following redirects when asked to). `route` is called
    // exactly once with the final response head, before the first body byte, or
    // after completion when the body is empty.
    virtual http_response perform(const http_request& req, const body_router& route = nullptr) = 0;
};

class http_client : public http_session {
public:
    struct options {
        std::string user_agent;
        std::size_t receive_buffer_bytes;
        bool verify_tls;

        options();
    };

    http_client();
    explicit http_client(const options& opts);
    ~http_client() override;

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    http_response perform(const http_request& req, const body_router& route = nullptr) override;

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    void print_request_details(const http_request& req) const;
    void print_response_details(const http_response& resp) const;
};
