#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

// One remote object and where it goes. Identity is the (source, destination)
// pair; the size hint is informational.
struct work_item {
    std::string source_url;
    std::string destination_path;
    std::optional<std::uint64_t> size_hint;

    work_item() = default;
    work_item(std::string source_url, std::string destination_path,
              std::optional<std::uint64_t> size_hint = std::nullopt)
        : source_url(std::move(source_url)), destination_path(std::move(destination_path)),
          size_hint(size_hint) {}

    bool operator==(const work_item& other) const {
        return source_url == other.source_url && destination_path == other.destination_path;
    }
    bool operator!=(const work_item& other) const {
        return !(*this == other);
    }
    bool operator<(const work_item& other) const {
        return std::tie(source_url, destination_path) <
               std::tie(other.source_url, other.destination_path);
    }
};

enum class transfer_status {
    completed,
    skipped,   // already complete on disk
    failed,    // retried in a later round
    cancelled, // interrupted by a user stop; the partial file stays a valid resume point
};

struct transfer_outcome {
    transfer_status status;
    std::string reason;

    static transfer_outcome completed() {
        return {transfer_status::completed, ""};
    }
    static transfer_outcome skipped(const std::string& reason = "already complete") {
        return {transfer_status::skipped, reason};
    }
    static transfer_outcome failed(const std::string& reason) {
        return {transfer_status::failed, reason};
    }
    static transfer_outcome cancelled() {
        return {transfer_status::cancelled, "cancelled"};
    }
};

const char* to_string(transfer_status status);

class item_fetcher {
public:
    virtual ~item_fetcher() = default;

    // Must not throw for per-item problems; those are reported as failed.
    virtual transfer_outcome fetch(const work_item& item) = 0;
};
