#include "transfer/transfer_task.hpp"

#include <chrono>
#include <fstream>

#include "util/byte_utils.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace {
struct stream_state {
    std::ofstream file;
    std::uint64_t offset = 0;   // bytes kept from before this request
    std::uint64_t received = 0; // bytes written by this request
    std::uint64_t total = 0;    // true object size, 0 when unknown
    bool streaming = false;
    bool skipped = false;
    bool cancelled = false;
    std::string error;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
};

bool decline_body(const char*, std::size_t) {
    return false;
}
} // namespace

transfer_task::options::options() : connect_timeout_seconds(15), read_timeout_seconds(60) {}

transfer_task::transfer_task(authenticated_transport& transport, const cancellation_token& cancel,
                             options opts, progress_callback_t on_progress)
    : m_transport(transport), m_cancel(cancel), m_options(opts),
      m_on_progress(std::move(on_progress)) {}

http_request transfer_task::make_request(const std::string& url) const {
    http_request req(url);
    req.connect_timeout_seconds = m_options.connect_timeout_seconds;
    req.read_timeout_seconds = m_options.read_timeout_seconds;
    return req;
}

std::optional<std::uint64_t> transfer_task::parse_content_length(const http_response& response) {
    auto it = response.headers.find("content-length");
    if (it == response.headers.end())
        return std::nullopt;
    return byte_utils::parse_size(it->second);
}

std::optional<transfer_task::content_range>
transfer_task::parse_content_range(const http_response& response) {
    auto it = response.headers.find("content-range");
    if (it == response.headers.end())
        return std::nullopt;

    const std::string& value = it->second;
    if (value.compare(0, 6, "bytes ") != 0)
        return std::nullopt;
    size_t slash_pos = value.find('/', 6);
    if (slash_pos == std::string::npos)
        return std::nullopt;

    content_range range;
    std::string span = value.substr(6, slash_pos - 6);
    if (span != "*") {
        size_t dash_pos = span.find('-');
        if (dash_pos == std::string::npos)
            return std::nullopt;
        range.first = byte_utils::parse_size(span.substr(0, dash_pos));
        range.last = byte_utils::parse_size(span.substr(dash_pos + 1));
        if (!range.first || !range.last)
            return std::nullopt;
    }
    std::string total = value.substr(slash_pos + 1);
    if (total != "*") {
        range.total = byte_utils::parse_size(total);
        if (!range.total)
            return std::nullopt;
    }
    return range;
}

transfer_outcome transfer_task::fetch(const work_item& item) {
    const fs::path destination(item.destination_path);
    try {
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path());
        }

        attempt_result result = attempt(item, destination);
        if (result.restart) {
            result = attempt(item, destination);
            if (result.restart) {
                result.outcome = transfer_outcome::failed("remote size keeps disagreeing");
            }
        }
        if (result.outcome.status == transfer_status::failed) {
            LOG_ERROR("transfer",
                      "Error downloading " << item.source_url << ": " << result.outcome.reason);
        }
        return result.outcome;
    } catch (const operation_cancelled&) {
        return transfer_outcome::cancelled();
    } catch (const std::exception& e) {
        LOG_ERROR("transfer", "Error downloading " << item.source_url << ": " << e.what());
        return transfer_outcome::failed(e.what());
    }
}

transfer_task::attempt_result transfer_task::attempt(const work_item& item,
                                                     const fs::path& destination) {
    const std::string name = destination.filename().string();

    std::uint64_t existing = 0;
    if (fs::exists(destination)) {
        existing = fs::file_size(destination);
    }

    http_request req = make_request(item.source_url);
    if (existing > 0) {
        req.headers["Range"] = "bytes=" + std::to_string(existing) + "-";
    }

    stream_state state;
    auto write_chunk = [&](const char* data, std::size_t size) {
        if (m_cancel.is_cancelled()) {
            state.cancelled = true;
            return false;
        }
        if (state.total > 0 && state.offset + state.received + size > state.total) {
            state.error = "server sent more bytes than announced";
            return false;
        }
        state.file.write(data, static_cast<std::streamsize>(size));
        if (!state.file) {
            state.error = "write to " + destination.string() + " failed";
            return false;
        }
        state.received += size;

        if (m_on_progress) {
            double secs = std::chrono::duration_cast<std::chrono::duration<double>>(
                              std::chrono::steady_clock::now() - state.started)
                              .count();
            std::uint64_t total = state.total > 0 ? state.total : item.size_hint.value_or(0);
            m_on_progress({destination.string(), state.offset + state.received, total,
                           secs > 0.0 ? static_cast<double>(state.received) / secs : 0.0});
        }
        return true;
    };

    auto response = m_transport.request(req, [&](const http_response& head) -> body_sink {
        if (head.status_code == 206) {
            auto range = parse_content_range(head);
            std::uint64_t start = range && range->first ? *range->first : 0;
            if (start != existing) {
                state.error = "server resumed at byte " + std::to_string(start) + " instead of " +
                              std::to_string(existing);
                return decline_body;
            }
            auto length = parse_content_length(head);
            state.offset = existing;
            if (range && range->total) {
                state.total = *range->total;
            } else if (length) {
                state.total = *length + existing;
            }
        } else if (head.status_code == 200) {
            auto length = parse_content_length(head);
            if (existing > 0) {
                if (length && *length == existing) {
                    state.skipped = true;
                    return decline_body;
                }
                LOG_WARN("transfer",
                         "Server doesn't support resume for " << name << ". Re-downloading.");
            }
            state.offset = 0;
            state.total = length.value_or(0);
        } else {
            return nullptr;
        }

        if (state.total > 0 && state.offset >= state.total) {
            state.skipped = true;
            return decline_body;
        }

        auto mode = std::ios::binary | (state.offset > 0 ? std::ios::app : std::ios::trunc);
        state.file.open(destination, mode);
        if (!state.file.is_open()) {
            state.error = "cannot open " + destination.string();
            return decline_body;
        }
        state.streaming = true;
        return write_chunk;
    });

    if (state.file.is_open()) {
        state.file.close();
        if (!state.file && state.error.empty()) {
            state.error = "closing " + destination.string() + " failed";
        }
    }

    if (response.status_code == 416) {
        // "bytes */N" already carries the remote size, even when N is 0
        auto range = parse_content_range(response);
        std::optional<std::uint64_t> total = range ? range->total : std::nullopt;
        return handle_unsatisfiable(item, destination, existing, total);
    }
    if (state.cancelled) {
        return {transfer_outcome::cancelled(), false};
    }
    if (state.skipped) {
        LOG_INFO("transfer", "Skipping already completed file: " << name);
        return {transfer_outcome::skipped(), false};
    }
    if (!state.error.empty()) {
        return {transfer_outcome::failed(state.error), false};
    }
    if (!state.streaming) {
        raise_for_status(response);
        return {transfer_outcome::failed("unexpected status " +
                                         std::to_string(response.status_code)),
                false};
    }

    std::uint64_t final_size = state.offset + state.received;
    if (state.total > 0 && final_size != state.total) {
        return {transfer_outcome::failed("incomplete: " + std::to_string(final_size) + " of " +
                                         std::to_string(state.total) + " bytes"),
                false};
    }

    LOG_INFO("transfer", "Finished " << name << " (" << byte_utils::format_bytes(final_size) << ")");
    return {transfer_outcome::completed(), false};
}

transfer_task::attempt_result transfer_task::handle_unsatisfiable(const work_item& item,
                                                                  const fs::path& destination,
                                                                  std::uint64_t existing,
                                                                  std::optional<std::uint64_t> total) {
    if (!total) {
        total = query_total_size(item.source_url);
    }
    if (!total) {
        return {transfer_outcome::failed("range not satisfiable and remote size unknown"), false};
    }
    if (existing == *total) {
        LOG_INFO("transfer",
                 "Skipping already completed file: " << destination.filename().string());
        return {transfer_outcome::skipped(), false};
    }

    LOG_WARN("transfer", "File corruption detected (local " << existing << " bytes, remote "
                                                            << *total
                                                            << " bytes). Re-downloading: "
                                                            << destination.string());
    fs::remove(destination);
    return {transfer_outcome::failed("local file discarded"), true};
}

std::optional<std::uint64_t> transfer_task::query_total_size(const std::string& url) {
    // A one byte range answers with the full size in Content-Range; the body
    // itself is never read
    http_request size_req = make_request(url);
    size_req.headers["Range"] = "bytes=0-0";

    std::optional<std::uint64_t> total;
    m_transport.request(size_req, [&](const http_response& head) -> body_sink {
        if (head.status_code == 206 || head.status_code == 416) {
            auto range = parse_content_range(head);
            if (range && range->total)
                total = range->total;
        } else if (head.status_code == 200) {
            total = parse_content_length(head);
        }
        return decline_body;
    });
    return total;
}
