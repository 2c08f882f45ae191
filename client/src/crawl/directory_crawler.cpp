#include "crawl/directory_crawler.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>

#include "net/login_page.hpp"
#include "util/log.hpp"
#include "util/url_utils.hpp"

namespace {
// Last path segment of a URL, still percent-encoded, without a trailing slash.
std::string last_segment(const std::string& url) {
    std::string path = url;
    size_t query_pos = path.find_first_of("?#");
    if (query_pos != std::string::npos)
        path.erase(query_pos);
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    size_t slash_pos = path.rfind('/');
    return slash_pos == std::string::npos ? path : path.substr(slash_pos + 1);
}

// Decodes one URL path segment into a single local file or directory name.
// Names that would leave their parent directory are refused.
std::optional<std::string> local_name(const std::string& encoded) {
    std::string name = url_utils::percent_decode(encoded);
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
        return std::nullopt;
    return name;
}

// Local directory for a listing URL below the base URL, nullopt when one of
// its segments is not a usable name.
std::optional<std::filesystem::path> local_directory(const std::string& output_dir,
                                                     const std::string& relative_url) {
    std::filesystem::path dir(output_dir);
    size_t start = 0;
    while (start <= relative_url.size()) {
        size_t end = relative_url.find('/', start);
        if (end == std::string::npos)
            end = relative_url.size();
        if (end > start) {
            auto name = local_name(relative_url.substr(start, end - start));
            if (!name)
                return std::nullopt;
            dir /= *name;
        }
        start = end + 1;
    }
    return dir;
}

std::vector<std::string> extract_hrefs(const std::string& html) {
    std::vector<std::string> hrefs;
    std::string lower = html;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t pos = 0;
    while ((pos = lower.find("<a", pos)) != std::string::npos) {
        size_t tag_end = lower.find('>', pos);
        if (tag_end == std::string::npos)
            break;
        char next = lower[pos + 2];
        if (next != ' ' && next != '\t' && next != '\n' && next != '\r') {
            pos += 2;
            continue;
        }
        size_t href_pos = lower.find("href", pos);
        if (href_pos != std::string::npos && href_pos < tag_end) {
            size_t i = href_pos + 4;
            while (i < tag_end && (html[i] == ' ' || html[i] == '='))
                ++i;
            std::string value;
            if (i < tag_end && (html[i] == '"' || html[i] == '\'')) {
                char quote = html[i];
                size_t close = html.find(quote, i + 1);
                if (close != std::string::npos) {
                    value = html.substr(i + 1, close - i - 1);
                    tag_end = std::max(tag_end, lower.find('>', close));
                }
            } else {
                size_t end = i;
                while (end < tag_end && html[end] != ' ')
                    ++end;
                value = html.substr(i, end - i);
            }
            if (!value.empty())
                hrefs.push_back(login_page::decode_entities(value));
        }
        pos = tag_end == std::string::npos ? lower.size() : tag_end + 1;
    }
    return hrefs;
}
} // namespace

directory_listing parse_index_page(const std::string& html, const std::string& page_url) {
    directory_listing listing;
    for (const auto& href : extract_hrefs(html)) {
        // Skip parent directory links, sort links and absolute paths
        if (href == "../" || href == "./" || href[0] == '?' || href[0] == '/' || href[0] == '#')
            continue;

        std::string full_url;
        try {
            full_url = url_utils::resolve(page_url, href);
        } catch (const std::invalid_argument& e) {
            LOG_DEBUG("crawl", "Ignoring link " << href << ": " << e.what());
            continue;
        }
        if (href.back() == '/') {
            listing.directories.push_back(full_url);
        } else {
            listing.files.push_back(full_url);
        }
    }
    return listing;
}

crawl_filter::crawl_filter()
    : include_suffixes{".avg_rade9h.tif.gz", ".cf_cvg.tif.gz"}, excluded_directories{"vcmslcfg"} {}

directory_crawler::directory_crawler(list_function list, std::string base_url,
                                     std::string output_dir, crawl_filter filter,
                                     const cancellation_token& cancel)
    : m_list(std::move(list)), m_base_url(std::move(base_url)),
      m_output_dir(std::move(output_dir)), m_filter(std::move(filter)), m_cancel(cancel) {}

bool directory_crawler::keep_file(const std::string& file_name) const {
    if (m_filter.include_suffixes.empty())
        return true;
    for (const auto& suffix : m_filter.include_suffixes) {
        if (url_utils::ends_with(file_name, suffix))
            return true;
    }
    return false;
}

bool directory_crawler::skip_directory(const std::string& directory_name) const {
    const auto& excluded = m_filter.excluded_directories;
    return std::find(excluded.begin(), excluded.end(), directory_name) != excluded.end();
}

std::vector<work_item> directory_crawler::collect() {
    std::vector<work_item> items;
    std::set<std::string> visited;
    std::vector<std::string> stack{m_base_url};

    while (!stack.empty()) {
        m_cancel.throw_if_cancelled();

        std::string url = stack.back();
        stack.pop_back();
        if (!url_utils::starts_with(url, m_base_url) || !visited.insert(url).second)
            continue;

        auto save_dir = local_directory(m_output_dir, url.substr(m_base_url.size()));
        if (!save_dir) {
            LOG_WARN("crawl", "Skipping directory with an unusable name: " << url);
            continue;
        }

        LOG_INFO("crawl", "Scanning directory: " << url);
        auto listing = m_list(url);
        if (!listing) {
            LOG_WARN("crawl", "Failed to access " << url);
            continue;
        }

        for (const auto& file_url : listing->files) {
            auto file_name = local_name(last_segment(file_url));
            if (!file_name) {
                LOG_WARN("crawl", "Skipping file with an unusable name: " << file_url);
                continue;
            }
            if (!keep_file(*file_name))
                continue;
            items.emplace_back(file_url, (*save_dir / *file_name).lexically_normal().string());
        }

        // Reverse so sub-directories are visited in listing order
        for (auto it = listing->directories.rbegin(); it != listing->directories.rend(); ++it) {
            std::string dir_name = url_utils::percent_decode(last_segment(*it));
            if (skip_directory(dir_name)) {
                LOG_INFO("crawl", "Skipping excluded directory: " << dir_name);
                continue;
            }
            stack.push_back(*it);
        }
    }
    return items;
}
