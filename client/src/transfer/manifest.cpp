#include "transfer/manifest.hpp"

#include <filesystem>
#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

#include "util/log.hpp"

namespace manifest {

std::vector<work_item> deduplicate(const std::vector<work_item>& items) {
    std::set<work_item> seen;
    std::vector<work_item> unique;
    unique.reserve(items.size());
    for (const auto& item : items) {
        if (seen.insert(item).second) {
            unique.push_back(item);
        }
    }
    return unique;
}

std::optional<std::vector<work_item>> load_cache(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        if (!json.is_array()) {
            LOG_WARN("manifest", "Cache " << path << " is not a JSON array");
            return std::nullopt;
        }

        std::vector<work_item> items;
        items.reserve(json.size());
        for (const auto& entry : json) {
            if (!entry.is_array() || entry.size() < 2 || !entry[0].is_string() ||
                !entry[1].is_string()) {
                LOG_WARN("manifest", "Skipping malformed cache entry: " << entry.dump());
                continue;
            }
            work_item item(entry[0].get<std::string>(), entry[1].get<std::string>());
            if (entry.size() > 2 && entry[2].is_number_unsigned()) {
                item.size_hint = entry[2].get<std::uint64_t>();
            }
            items.push_back(std::move(item));
        }
        return items;
    } catch (const std::exception& e) {
        LOG_WARN("manifest", "Error loading cache " << path << ": " << e.what());
        return std::nullopt;
    }
}

bool save_cache(const std::string& path, const std::vector<work_item>& items) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json entry = nlohmann::json::array({item.source_url, item.destination_path});
        if (item.size_hint) {
            entry.push_back(*item.size_hint);
        }
        json.push_back(std::move(entry));
    }

    // Write beside the target and rename so an interrupted save keeps the old cache
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            LOG_WARN("manifest", "Could not open " << temp_path << " for writing");
            return false;
        }
        file << json.dump(2) << '\n';
        if (!file) {
            LOG_WARN("manifest", "Could not write " << temp_path);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        LOG_WARN("manifest", "Could not save cache " << path << ": " << ec.message());
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

} // namespace manifest
