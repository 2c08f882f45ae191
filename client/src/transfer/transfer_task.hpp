#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "net/authenticated_transport.hpp"
#include "net/http.hpp"
#include "transfer/work_item.hpp"
#include "util/cancellation.hpp"

// Downloads one remote object into one local file, resuming a partial file
// with a byte range request. The file is never left larger than the remote
// object.
class transfer_task : public item_fetcher {
public:
    struct progress_info {
        std::string destination;
        std::uint64_t bytes_done;  // including bytes kept from an earlier run
        std::uint64_t bytes_total; // 0 when unknown
        double bytes_per_sec;
    };

    struct content_range {
        std::optional<std::uint64_t> first;
        std::optional<std::uint64_t> last;
        std::optional<std::uint64_t> total;
    };

    struct options {
        long connect_timeout_seconds;
        long read_timeout_seconds;

        options();
    };

    using progress_callback_t = std::function<void(const progress_info&)>;

    transfer_task(authenticated_transport& transport, const cancellation_token& cancel,
                  options opts = options(), progress_callback_t on_progress = nullptr);

    transfer_outcome fetch(const work_item& item) override;

    static std::optional<std::uint64_t> parse_content_length(const http_response& response);
    // "bytes 100-199/1000" or "bytes */1000"
    static std::optional<content_range> parse_content_range(const http_response& response);

private:
    struct attempt_result {
        transfer_outcome outcome;
        bool restart; // local file was discarded; fetch again from zero
    };

    authenticated_transport& m_transport;
    const cancellation_token& m_cancel;
    options m_options;
    progress_callback_t m_on_progress;

    http_request make_request(const std::string& url) const;

    attempt_result attempt(const work_item& item, const std::filesystem::path& destination);
    attempt_result handle_unsatisfiable(const work_item& item,
                                        const std::filesystem::path& destination,
                                        std::uint64_t existing,
                                        std::optional<std::uint64_t> total);
    std::optional<std::uint64_t> query_total_size(const std::string& url);
};
