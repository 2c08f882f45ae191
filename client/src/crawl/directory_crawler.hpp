#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "transfer/work_item.hpp"
#include "util/cancellation.hpp"

struct directory_listing {
    std::vector<std::string> files;       // absolute URLs
    std::vector<std::string> directories; // absolute URLs ending in '/'
};

// Extracts file and sub-directory links from an auto-generated index page.
// Parent, self, query and absolute-path links are ignored.
directory_listing parse_index_page(const std::string& html, const std::string& page_url);

struct crawl_filter {
    // A file is kept when its name ends with one of these; empty keeps all.
    std::vector<std::string> include_suffixes;
    std::vector<std::string> excluded_directories;

    crawl_filter();
};

class directory_crawler {
public:
    // nullopt when the directory could not be listed
    using list_function = std::function<std::optional<directory_listing>(const std::string& url)>;

    directory_crawler(list_function list, std::string base_url, std::string output_dir,
                      crawl_filter filter, const cancellation_token& cancel);

    // Walks everything under the base URL and maps each kept file to
    // output_dir/<relative directory>/<file name>.
    std::vector<work_item> collect();

private:
    list_function m_list;
    std::string m_base_url;
    std::string m_output_dir;
    crawl_filter m_filter;
    const cancellation_token& m_cancel;

    bool keep_file(const std::string& file_name) const;
    bool skip_directory(const std::string& directory_name) const;
};
