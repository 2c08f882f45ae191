#include "net/http.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <curl/curl.h>

#include "util/defer.hpp"
#include "util/log.hpp"

constexpr const char* USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64; rv:143.0) Gecko/20100101 Firefox/143.0";
constexpr long MAX_REDIRECTS = 20;

namespace {
std::once_flag curl_init_flag;

// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

http_error_kind classify_curl_error(CURLcode code) {
    switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
        return http_error_kind::connect;
    case CURLE_OPERATION_TIMEDOUT:
        return http_error_kind::timeout;
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
    case CURLE_SSL_CONNECT_ERROR:
        return http_error_kind::connection_reset;
    case CURLE_PARTIAL_FILE:
        return http_error_kind::truncated;
    case CURLE_ABORTED_BY_CALLBACK:
        return http_error_kind::aborted;
    default:
        return http_error_kind::other;
    }
}

// State of one exchange, shared with the libcurl callbacks.
struct exchange_state {
    CURL* handle = nullptr;
    const http_request* request = nullptr;
    const body_router* route = nullptr;
    http_response response;
    body_sink sink;
    bool routed = false;
    bool declined = false;

    void fill_head() {
        long status_code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code);
        response.status_code = static_cast<int>(status_code);

        char* effective_url = nullptr;
        if (curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
            effective_url) {
            response.effective_url = effective_url;
        } else {
            response.effective_url = request->url;
        }
    }

    void route_once() {
        if (routed)
            return;
        routed = true;
        fill_head();
        if (route && *route) {
            sink = (*route)(response);
        }
    }
};

// Callback function to write response data
size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<exchange_state*>(userp);
    size_t total_size = size * nmemb;
    state->route_once();
    if (state->sink) {
        if (!state->sink(contents, total_size)) {
            state->declined = true;
            return 0;
        }
        return total_size;
    }
    state->response.body.append(contents, total_size);
    return total_size;
}

// Headers arrive one line at a time; a status line starts the headers of the
// next hop of a redirect chain.
size_t header_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<exchange_state*>(userp);
    size_t total_size = size * nmemb;
    std::string line(contents, total_size);

    if (line.compare(0, 5, "HTTP/") == 0) {
        state->response.headers.clear();
        return total_size;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos != std::string::npos) {
        std::string header_name = to_lower(trim(line.substr(0, colon_pos)));
        std::string header_value = trim(line.substr(colon_pos + 1));
        state->response.headers[header_name] = header_value;
    }
    return total_size;
}

int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<exchange_state*>(userp);
    if (state->request->abort_check && state->request->abort_check()) {
        return 1;
    }
    return 0;
}
} // namespace

const char* to_string(http_error_kind kind) {
    switch (kind) {
    case http_error_kind::connect:
        return "connect";
    case http_error_kind::timeout:
        return "timeout";
    case http_error_kind::connection_reset:
        return "connection reset";
    case http_error_kind::truncated:
        return "truncated";
    case http_error_kind::aborted:
        return "aborted";
    case http_error_kind::other:
        return "other";
    }
    return "unknown";
}

void raise_for_status(const http_response& response) {
    if (response.status_code >= 400) {
        throw http_status_error(response.status_code, response.effective_url);
    }
}

http_client::options::options()
    : user_agent(USER_AGENT), receive_buffer_bytes(64 * 1024), verify_tls(true) {}

class http_client::impl {
public:
    explicit impl(const options& opts) : opts(opts), share(nullptr) {
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

        share = curl_share_init();
        if (!share) {
            throw std::runtime_error("Failed to initialize curl share handle");
        }
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lock_callback);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlock_callback);
        curl_share_setopt(share, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        // Connections stay per handle: handles run on several threads at once
    }

    ~impl() {
        if (share) {
            curl_share_cleanup(share);
        }
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* new_handle() const {
        CURL* handle = curl_easy_init();
        if (!handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }
        curl_easy_setopt(handle, CURLOPT_SHARE, share);
        curl_easy_setopt(handle, CURLOPT_USERAGENT, opts.user_agent.c_str());
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, opts.verify_tls ? 1L : 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, opts.verify_tls ? 2L : 0L);
        // Prefer HTTP/2 over TLS if available (falls back automatically)
        curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, static_cast<long>(opts.receive_buffer_bytes));
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        // Enable the cookie engine; the jar lives in the share handle.
        // No CURLOPT_ACCEPT_ENCODING: Content-Length and Range offsets must
        // describe the bytes handed to the sink.
        curl_easy_setopt(handle, CURLOPT_COOKIEFILE, "");
        return handle;
    }

    options opts;
    CURLSH* share;
    std::mutex locks[CURL_LOCK_DATA_LAST];

private:
    static void lock_callback(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<impl*>(userptr)->locks[data].lock();
    }

    static void unlock_callback(CURL*, curl_lock_data data, void* userptr) {
        static_cast<impl*>(userptr)->locks[data].unlock();
    }
};

http_client::http_client() : http_client(options()) {}

http_client::http_client(const options& opts) : pimpl(std::make_unique<impl>(opts)) {}

http_client::~http_client() = default;

http_response http_client::perform(const http_request& req, const body_router& route) {
    print_request_details(req);

    CURL* handle = pimpl->new_handle();
    DEFER(curl_easy_cleanup(handle););

    exchange_state state;
    state.handle = handle;
    state.request = &req;
    state.route = &route;

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, req.connect_timeout_seconds);
    // Read timeout: give up when less than one byte arrives per read_timeout_seconds
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, req.read_timeout_seconds);

    if (req.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (req.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.length()));
    } else if (req.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        if (!req.body.empty()) {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, req.body.c_str());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.length()));
        }
    }

    // Set custom headers
    struct curl_slist* header_list = nullptr;
    DEFER(if (header_list) curl_slist_free_all(header_list););
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    if (req.method == "POST") {
        header_list = curl_slist_append(header_list, "Expect:");
    }
    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(handle);

    if (res == CURLE_WRITE_ERROR && state.declined) {
        LOG_DEBUG("http", "Receiver stopped reading body of " << req.url);
    } else if (res != CURLE_OK) {
        std::string message = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        LOG_DEBUG("http", "curl_easy_perform() failed for " << req.url << ": " << message);
        throw http_error(classify_curl_error(res), message);
    }

    state.route_once();

    print_response_details(state.response);
    return std::move(state.response);
}

void http_client::print_request_details(const http_request& req) const {
    if (!logger::enabled(log_level::debug))
        return;
    LOG_DEBUG("http", "=== HTTP REQUEST === " << req.method << " " << req.url);
    for (const auto& header : req.headers) {
        if (header.first == "Authorization") {
            LOG_DEBUG("http", "  " << header.first << ": <redacted>");
        } else {
            LOG_DEBUG("http", "  " << header.first << ": " << header.second);
        }
    }
}

void http_client::print_response_details(const http_response& resp) const {
    if (!logger::enabled(log_level::debug))
        return;
    LOG_DEBUG("http", "=== HTTP RESPONSE === " << resp.status_code << " " << resp.effective_url);
    for (const auto& header : resp.headers) {
        LOG_DEBUG("http", "  " << header.first << ": " << header.second);
    }
}
