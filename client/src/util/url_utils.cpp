#include "util/url_utils.hpp"

#include <climits>
#include <memory>
#include <new>
#include <stdexcept>

#include <curl/curl.h>

namespace {
using curl_string = std::unique_ptr<char, decltype(&curl_free)>;
using curl_url_handle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

int curl_length(const std::string& text) {
    if (text.size() > static_cast<std::size_t>(INT_MAX))
        throw std::length_error("string too long for libcurl");
    return static_cast<int>(text.size());
}

void set_url(CURLU* handle, const std::string& url) {
    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw std::invalid_argument("cannot use URL '" + url + "': " +
                                    std::to_string(static_cast<int>(rc)));
    }
}
} // namespace

namespace url_utils {

std::string percent_encode(const std::string& text) {
    if (text.empty())
        return text;
    curl_string escaped(curl_easy_escape(nullptr, text.data(), curl_length(text)), curl_free);
    if (!escaped)
        throw std::bad_alloc();
    return escaped.get();
}

std::string percent_decode(const std::string& text) {
    if (text.empty())
        return text;
    int length = 0;
    curl_string decoded(curl_easy_unescape(nullptr, text.data(), curl_length(text), &length),
                        curl_free);
    if (!decoded)
        throw std::bad_alloc();
    return std::string(decoded.get(), static_cast<std::size_t>(length));
}

std::string form_encode(const field_list& fields) {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty())
            out.push_back('&');
        out += percent_encode(field.first);
        out.push_back('=');
        out += percent_encode(field.second);
    }
    return out;
}

std::string with_query(const std::string& url, const field_list& fields) {
    if (fields.empty())
        return url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + form_encode(fields);
}

std::string resolve(const std::string& base, const std::string& reference) {
    if (reference.empty())
        return base;

    curl_url_handle handle(curl_url(), curl_url_cleanup);
    if (!handle)
        throw std::bad_alloc();
    set_url(handle.get(), base);

    // A fragment-only reference points at the base document itself
    std::string target = reference.substr(0, reference.find('#'));
    if (!target.empty())
        set_url(handle.get(), target);
    curl_url_set(handle.get(), CURLUPART_FRAGMENT, nullptr, 0);

    char* part = nullptr;
    CURLUcode rc = curl_url_get(handle.get(), CURLUPART_URL, &part, 0);
    curl_string resolved(part, curl_free);
    if (rc != CURLUE_OK || !resolved) {
        throw std::invalid_argument("cannot resolve '" + reference + "' against '" + base + "'");
    }
    return resolved.get();
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace url_utils
