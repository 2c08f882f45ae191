#include "config.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

app_config::app_config()
    : base_url("https://eogdata.mines.edu/nighttime_light/monthly_notile/"),
      auth_base("https://eogauth-new.mines.edu/realms/eog/protocol/openid-connect"),
      client_id("eogdata-new-apache"), redirect_uri("https://eogdata.mines.edu/oauth2callback"),
      scope("openid email"), output_dir("./eog_downloads"), cache_file("eog_files_cache.json"),
      rescan(false), max_workers(4), connect_timeout_seconds(15), read_timeout_seconds(60),
      max_attempts(10), retry_base_delay_ms(5000), retry_max_jitter_ms(1000),
      round_cooldown_ms(5000), max_rounds(0), chunk_size_bytes(64 * 1024),
      include_suffixes{".avg_rade9h.tif.gz", ".cf_cvg.tif.gz"}, excluded_directories{"vcmslcfg"},
      verbose(false) {}

namespace {
template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& target) {
    if (json.contains(key)) {
        target = json.at(key).get<T>();
    }
}

void read_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}
} // namespace

bool load_config_file(const std::string& path, app_config& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open config file " + path;
        return false;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        if (!json.is_object()) {
            error = "config file " + path + " must contain a JSON object";
            return false;
        }

        read_key(json, "base_url", config.base_url);
        read_key(json, "auth_base", config.auth_base);
        read_key(json, "client_id", config.client_id);
        read_key(json, "client_secret", config.client_secret);
        read_key(json, "redirect_uri", config.redirect_uri);
        read_key(json, "scope", config.scope);
        read_key(json, "username", config.username);
        read_key(json, "password", config.password);
        read_key(json, "output_dir", config.output_dir);
        read_key(json, "cache_file", config.cache_file);
        read_key(json, "max_workers", config.max_workers);
        read_key(json, "connect_timeout_seconds", config.connect_timeout_seconds);
        read_key(json, "read_timeout_seconds", config.read_timeout_seconds);
        read_key(json, "max_attempts", config.max_attempts);
        read_key(json, "retry_base_delay_ms", config.retry_base_delay_ms);
        read_key(json, "retry_max_jitter_ms", config.retry_max_jitter_ms);
        read_key(json, "round_cooldown_ms", config.round_cooldown_ms);
        read_key(json, "max_rounds", config.max_rounds);
        read_key(json, "chunk_size_bytes", config.chunk_size_bytes);
        read_key(json, "include_suffixes", config.include_suffixes);
        read_key(json, "excluded_directories", config.excluded_directories);
        read_key(json, "verbose", config.verbose);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = "invalid config file " + path + ": " + e.what();
        return false;
    }
}

void apply_environment(app_config& config) {
    read_env("EOG_USERNAME", config.username);
    read_env("EOG_PASSWORD", config.password);
    read_env("EOG_CLIENT_SECRET", config.client_secret);
}

bool validate_config(const app_config& config, std::string& error) {
    if (config.base_url.empty() || config.base_url.back() != '/') {
        error = "base_url must be a directory URL ending in '/'";
        return false;
    }
    if (config.auth_base.empty()) {
        error = "auth_base must not be empty";
        return false;
    }
    if (config.client_id.empty()) {
        error = "client_id must not be empty";
        return false;
    }
    if (config.max_workers == 0) {
        error = "max_workers must be at least 1";
        return false;
    }
    if (config.max_attempts < 1) {
        error = "max_attempts must be at least 1";
        return false;
    }
    if (config.connect_timeout_seconds <= 0 || config.read_timeout_seconds <= 0) {
        error = "timeouts must be positive";
        return false;
    }
    if (config.retry_base_delay_ms < 0 || config.retry_max_jitter_ms < 0 ||
        config.round_cooldown_ms < 0) {
        error = "delays must not be negative";
        return false;
    }
    if (config.chunk_size_bytes < 1024 || config.chunk_size_bytes > 10 * 1024 * 1024) {
        error = "chunk_size_bytes must be between 1 KiB and 10 MiB";
        return false;
    }
    return true;
}
