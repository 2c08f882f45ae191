#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Every tunable of a run. Defaults target the EOG nighttime light archive.
struct app_config {
    // Portal
    std::string base_url;
    std::string auth_base; // OpenID Connect realm prefix
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri;
    std::string scope;

    // Credentials (never written anywhere)
    std::string username;
    std::string password;

    // Local layout
    std::string output_dir;
    std::string cache_file;
    bool rescan;

    // Transfer tuning
    std::size_t max_workers;
    long connect_timeout_seconds;
    long read_timeout_seconds;
    int max_attempts;
    long retry_base_delay_ms;
    long retry_max_jitter_ms;
    long round_cooldown_ms;
    std::size_t max_rounds; // 0 = unlimited
    std::size_t chunk_size_bytes;

    // Crawl filters
    std::vector<std::string> include_suffixes;
    std::vector<std::string> excluded_directories;

    bool verbose;

    app_config();

    std::string token_url() const {
        return auth_base + "/token";
    }
    std::string authorize_url() const {
        return auth_base + "/auth";
    }
};

// Overlays the keys present in a JSON object file onto `config`. Unknown keys
// are ignored; a key with the wrong type is an error.
bool load_config_file(const std::string& path, app_config& config, std::string& error);

// EOG_USERNAME, EOG_PASSWORD and EOG_CLIENT_SECRET.
void apply_environment(app_config& config);

// Returns false when a required value is missing or out of range.
bool validate_config(const app_config& config, std::string& error);
