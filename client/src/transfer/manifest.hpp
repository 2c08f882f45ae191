#pragma once

#include <optional>
#include <string>
#include <vector>

#include "transfer/work_item.hpp"

namespace manifest {

// Drops repeated (source, destination) pairs, keeping the first occurrence
// and the original order.
std::vector<work_item> deduplicate(const std::vector<work_item>& items);

// Reads a cache written by save_cache: a JSON array of [url, path] or
// [url, path, size] entries. nullopt when the file is missing or unreadable.
std::optional<std::vector<work_item>> load_cache(const std::string& path);

bool save_cache(const std::string& path, const std::vector<work_item>& items);

} // namespace manifest
