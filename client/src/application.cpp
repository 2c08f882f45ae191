#include "application.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <pthread.h>
#include <termios.h>
#include <unistd.h>

#include "crawl/directory_crawler.hpp"
#include "net/authenticator.hpp"
#include "net/http.hpp"
#include "transfer/manifest.hpp"
#include "transfer/round_scheduler.hpp"
#include "transfer/transfer_task.hpp"
#include "util/byte_utils.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace {
// Prints one line per file each time it passes another quarter.
class progress_reporter {
public:
    void update(const transfer_task::progress_info& info) {
        if (info.bytes_total == 0)
            return;
        int quarter = static_cast<int>(info.bytes_done * 4 / info.bytes_total);
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            int& last = m_last_quarter[info.destination];
            if (quarter <= last)
                return;
            last = quarter;
            if (quarter >= 4)
                m_last_quarter.erase(info.destination);
        }
        LOG_INFO("progress", fs::path(info.destination).filename().string()
                                 << " " << quarter * 25 << "% ("
                                 << byte_utils::format_bytes(info.bytes_done) << " of "
                                 << byte_utils::format_bytes(info.bytes_total) << ", "
                                 << byte_utils::format_rate(info.bytes_per_sec) << ")");
    }

private:
    std::mutex m_mutex;
    std::map<std::string, int> m_last_quarter;
};

bool parse_count(const char* text, std::size_t& target) {
    auto value = byte_utils::parse_size(text);
    if (!value)
        return false;
    target = static_cast<std::size_t>(*value);
    return true;
}

std::string read_line(const std::string& prompt, bool hide_input) {
    std::cout << prompt << std::flush;

    termios saved{};
    bool restore = false;
    if (hide_input && isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restore = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    std::string line;
    std::getline(std::cin, line);

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cout << std::endl;
    }
    return line;
}

auth_settings make_auth_settings(const app_config& config) {
    auth_settings settings;
    settings.realm_base = config.auth_base;
    settings.token_url = config.token_url();
    settings.authorize_url = config.authorize_url();
    settings.redirect_uri = config.redirect_uri;
    settings.client_id = config.client_id;
    settings.client_secret = config.client_secret;
    settings.scope = config.scope;
    settings.protected_url = config.base_url;
    settings.connect_timeout_seconds = config.connect_timeout_seconds;
    settings.read_timeout_seconds = config.read_timeout_seconds;
    return settings;
}
} // namespace

void application::print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "\n"
        << "Mirrors the portal's file tree into the output directory, resuming partial\n"
        << "files and retrying failed ones until everything is present.\n"
        << "\nOptions:\n"
        << "  --config FILE        JSON configuration file\n"
        << "  --output DIR         download directory (default: ./eog_downloads)\n"
        << "  --cache FILE         file list cache (default: eog_files_cache.json)\n"
        << "  --rescan             ignore the cache and crawl the portal again\n"
        << "  --base-url URL       directory to mirror\n"
        << "  --user NAME          account name (or EOG_USERNAME)\n"
        << "  --client-id ID       OpenID client id\n"
        << "  --workers N          concurrent downloads (default: 4)\n"
        << "  --max-rounds N       stop after N rounds (default: 0, unlimited)\n"
        << "  --verbose            enable debug logging\n"
        << "  --help               show this text\n"
        << "\nThe password is read from EOG_PASSWORD or prompted for.\n";
}

application::parse_result application::parse_arguments(int argc, char** argv) {
    // The config file is the lowest layer, so find it first
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return parse_result::help;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file name" << std::endl;
                return parse_result::invalid;
            }
            std::string error;
            if (!load_config_file(argv[i + 1], m_config, error)) {
                std::cerr << error << std::endl;
                return parse_result::invalid;
            }
        }
    }

    apply_environment(m_config);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--output" && has_value) {
            m_config.output_dir = argv[++i];
        } else if (arg == "--cache" && has_value) {
            m_config.cache_file = argv[++i];
        } else if (arg == "--base-url" && has_value) {
            m_config.base_url = argv[++i];
        } else if (arg == "--user" && has_value) {
            m_config.username = argv[++i];
        } else if (arg == "--client-id" && has_value) {
            m_config.client_id = argv[++i];
        } else if (arg == "--workers" && has_value) {
            if (!parse_count(argv[++i], m_config.max_workers)) {
                std::cerr << "Invalid worker count: " << argv[i] << std::endl;
                return parse_result::invalid;
            }
        } else if (arg == "--max-rounds" && has_value) {
            if (!parse_count(argv[++i], m_config.max_rounds)) {
                std::cerr << "Invalid round count: " << argv[i] << std::endl;
                return parse_result::invalid;
            }
        } else if (arg == "--rescan") {
            m_config.rescan = true;
        } else if (arg == "--verbose") {
            m_config.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return parse_result::invalid;
        }
    }
    return parse_result::proceed;
}

bool application::prompt_credentials() {
    if (m_config.username.empty()) {
        m_config.username = read_line("Username (email): ", false);
    }
    if (m_config.password.empty()) {
        m_config.password = read_line("Password: ", true);
    }
    return !m_config.username.empty() && !m_config.password.empty();
}

void application::start_signal_watcher() {
    // Block the stop signals in every thread and take them synchronously here,
    // so a stop only flips the cancellation token
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread([this, signals]() {
        int received = 0;
        while (sigwait(&signals, &received) == 0) {
            if (m_cancel.is_cancelled()) {
                std::cerr << "\nForced exit." << std::endl;
                std::_Exit(static_cast<int>(exit_code::cancelled));
            }
            LOG_WARN("app", "Stop requested; partial files are kept for resume. "
                            "Press Ctrl+C again to exit immediately.");
            m_cancel.cancel();
        }
    }).detach();
}

std::vector<work_item> application::build_manifest(authenticated_transport& transport) {
    if (!m_config.rescan) {
        if (auto cached = manifest::load_cache(m_config.cache_file)) {
            LOG_INFO("app", "Loaded " << cached->size() << " files from cache '"
                                      << m_config.cache_file << "'.");
            return manifest::deduplicate(*cached);
        }
    }

    LOG_INFO("app", "Phase 1: Scanning directory structure (this may take a while)...");
    auto list = [this, &transport](const std::string& url) -> std::optional<directory_listing> {
        http_request req(url);
        req.connect_timeout_seconds = m_config.connect_timeout_seconds;
        req.read_timeout_seconds = m_config.read_timeout_seconds;
        try {
            auto response = transport.request(req);
            raise_for_status(response);
            return parse_index_page(response.body, response.effective_url);
        } catch (const operation_cancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN("crawl", "Failed to list " << url << ": " << e.what());
            return std::nullopt;
        }
    };

    crawl_filter filter;
    filter.include_suffixes = m_config.include_suffixes;
    filter.excluded_directories = m_config.excluded_directories;
    directory_crawler crawler(list, m_config.base_url, m_config.output_dir, filter, m_cancel);

    std::vector<work_item> collected = crawler.collect();
    std::vector<work_item> unique = manifest::deduplicate(collected);
    if (unique.size() < collected.size()) {
        LOG_INFO("app", "Removed " << collected.size() - unique.size() << " duplicate entries.");
    }

    if (manifest::save_cache(m_config.cache_file, unique)) {
        LOG_INFO("app", "Scan complete. Saved " << unique.size() << " files to '"
                                                << m_config.cache_file << "'.");
    } else {
        LOG_WARN("app", "Could not save cache; the next run will scan again.");
    }
    return unique;
}

int application::run(int argc, char** argv) {
    start_signal_watcher();

    switch (parse_arguments(argc, argv)) {
    case parse_result::help:
        return static_cast<int>(exit_code::success);
    case parse_result::invalid:
        return static_cast<int>(exit_code::usage);
    case parse_result::proceed:
        break;
    }

    logger::set_level(m_config.verbose ? log_level::debug : log_level::info);

    std::string error;
    if (!validate_config(m_config, error)) {
        LOG_ERROR("app", error);
        return static_cast<int>(exit_code::usage);
    }

    LOG_INFO("app", "=== EOG Data Downloader (Multi-threaded & Resume & Auto-Relogin & Cache) ===");
    LOG_INFO("app", "Target URL: " << m_config.base_url);

    if (!prompt_credentials()) {
        LOG_ERROR("app", "A username and password are required.");
        return static_cast<int>(exit_code::usage);
    }

    http_client::options client_options;
    client_options.receive_buffer_bytes = m_config.chunk_size_bytes;
    authenticator auth(credentials{m_config.username, m_config.password},
                       make_auth_settings(m_config), [client_options]() {
                           return std::make_shared<http_client>(client_options);
                       });

    retry_policy policy;
    policy.max_attempts = m_config.max_attempts;
    policy.base_delay = std::chrono::milliseconds(m_config.retry_base_delay_ms);
    policy.max_jitter = std::chrono::milliseconds(m_config.retry_max_jitter_ms);
    authenticated_transport transport(auth, m_config.auth_base, policy, m_cancel);

    LOG_INFO("app", "Initial authentication...");
    if (!transport.initialize()) {
        LOG_ERROR("app", "Authentication failed. Exiting.");
        return static_cast<int>(exit_code::fatal);
    }

    std::error_code ec;
    fs::create_directories(m_config.output_dir, ec);
    if (ec) {
        LOG_ERROR("app", "Cannot create " << m_config.output_dir << ": " << ec.message());
        return static_cast<int>(exit_code::fatal);
    }
    m_config.output_dir = fs::absolute(m_config.output_dir).lexically_normal().string();
    LOG_INFO("app", "Files will be saved to: " << m_config.output_dir);

    std::vector<work_item> items;
    try {
        items = build_manifest(transport);
    } catch (const operation_cancelled&) {
        LOG_WARN("app", "Scan stopped by user.");
        return static_cast<int>(exit_code::cancelled);
    }

    progress_reporter progress;
    transfer_task::options task_options;
    task_options.connect_timeout_seconds = m_config.connect_timeout_seconds;
    task_options.read_timeout_seconds = m_config.read_timeout_seconds;
    transfer_task task(transport, m_cancel, task_options,
                       [&progress](const transfer_task::progress_info& info) {
                           progress.update(info);
                       });

    scheduler_options options;
    options.max_workers = m_config.max_workers;
    options.round_cooldown = std::chrono::milliseconds(m_config.round_cooldown_ms);
    options.max_rounds = m_config.max_rounds;
    round_scheduler scheduler(task, m_cancel, options);
    scheduler.set_round_observer([](const round_report& report) {
        LOG_INFO("scheduler", "Round " << report.round << ": " << report.completed
                                       << " downloaded, " << report.skipped << " skipped, "
                                       << report.failed << " failed.");
    });

    LOG_INFO("app", "Phase 2: Starting download of " << items.size() << " files with "
                                                     << m_config.max_workers << " threads...");
    LOG_INFO("app", "Resume capability is enabled. Press Ctrl+C to stop safely.");

    run_summary summary = scheduler.run(items);

    if (summary.cancelled) {
        LOG_WARN("app", "Download stopped by user. " << summary.unfinished.size()
                                                     << " files left for the next run.");
        return static_cast<int>(exit_code::cancelled);
    }
    if (summary.round_limit_reached) {
        LOG_ERROR("app", summary.unfinished.size() << " files still failing after "
                                                   << summary.rounds << " rounds:");
        for (const auto& item : summary.unfinished) {
            auto it = summary.failure_counts.find(item);
            std::size_t failures = it == summary.failure_counts.end() ? 0 : it->second;
            LOG_ERROR("app", "  " << item.source_url << " (" << failures << " failures)");
        }
        return static_cast<int>(exit_code::round_limit);
    }

    LOG_INFO("app", "All downloads completed. " << summary.completed << " downloaded, "
                                                << summary.skipped << " already present, "
                                                << summary.rounds << " rounds.");
    return static_cast<int>(exit_code::success);
}
