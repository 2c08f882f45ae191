#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

#include "config.hpp"

namespace fs = std::filesystem;

namespace {
class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        std::random_device rd;
        file = fs::temp_directory_path() / ("eog_config_test_" + std::to_string(rd()) + ".json");
        unsetenv("EOG_USERNAME");
        unsetenv("EOG_PASSWORD");
        unsetenv("EOG_CLIENT_SECRET");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(file, ec);
        unsetenv("EOG_USERNAME");
        unsetenv("EOG_PASSWORD");
        unsetenv("EOG_CLIENT_SECRET");
    }

    void write(const std::string& text) {
        std::ofstream out(file);
        out << text;
    }
};
} // namespace

TEST_F(ConfigTest, DefaultsTargetMonthlyArchive) {
    app_config config;
    EXPECT_EQ(config.base_url, "https://eogdata.mines.edu/nighttime_light/monthly_notile/");
    EXPECT_EQ(config.token_url(),
              "https://eogauth-new.mines.edu/realms/eog/protocol/openid-connect/token");
    EXPECT_EQ(config.authorize_url(),
              "https://eogauth-new.mines.edu/realms/eog/protocol/openid-connect/auth");
    EXPECT_EQ(config.client_id, "eogdata-new-apache");
    EXPECT_EQ(config.max_workers, 4u);
    EXPECT_EQ(config.max_attempts, 10);
    EXPECT_EQ(config.max_rounds, 0u);
    EXPECT_EQ(config.chunk_size_bytes, 64u * 1024u);
    EXPECT_EQ(config.excluded_directories, std::vector<std::string>{"vcmslcfg"});

    std::string error;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, FileOverridesOnlyPresentKeys) {
    write(R"({
        "output_dir": "/srv/eog",
        "max_workers": 8,
        "max_rounds": 5,
        "include_suffixes": [".tif"],
        "verbose": true,
        "some_future_key": {"ignored": 1}
    })");
    app_config config;
    std::string error;
    ASSERT_TRUE(load_config_file(file.string(), config, error)) << error;
    EXPECT_EQ(config.output_dir, "/srv/eog");
    EXPECT_EQ(config.max_workers, 8u);
    EXPECT_EQ(config.max_rounds, 5u);
    EXPECT_EQ(config.include_suffixes, std::vector<std::string>{".tif"});
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.cache_file, "eog_files_cache.json");
}

TEST_F(ConfigTest, WrongTypeIsAnError) {
    write(R"({"max_workers": "eight"})");
    app_config config;
    std::string error;
    EXPECT_FALSE(load_config_file(file.string(), config, error));
    EXPECT_NE(error.find(file.string()), std::string::npos);
}

TEST_F(ConfigTest, NonObjectAndMissingFilesAreErrors) {
    app_config config;
    std::string error;
    EXPECT_FALSE(load_config_file((file.string() + ".absent"), config, error));
    EXPECT_FALSE(error.empty());

    write("[1, 2, 3]");
    error.clear();
    EXPECT_FALSE(load_config_file(file.string(), config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, EnvironmentSuppliesCredentials) {
    setenv("EOG_USERNAME", "env-user", 1);
    setenv("EOG_PASSWORD", "env-pass", 1);
    setenv("EOG_CLIENT_SECRET", "", 1);

    app_config config;
    config.client_secret = "from-file";
    apply_environment(config);
    EXPECT_EQ(config.username, "env-user");
    EXPECT_EQ(config.password, "env-pass");
    // Empty variables leave the value alone
    EXPECT_EQ(config.client_secret, "from-file");
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    std::string error;

    app_config no_slash;
    no_slash.base_url = "https://eogdata.mines.edu/nighttime_light";
    EXPECT_FALSE(validate_config(no_slash, error));

    app_config no_workers;
    no_workers.max_workers = 0;
    EXPECT_FALSE(validate_config(no_workers, error));

    app_config no_attempts;
    no_attempts.max_attempts = 0;
    EXPECT_FALSE(validate_config(no_attempts, error));

    app_config tiny_chunks;
    tiny_chunks.chunk_size_bytes = 16;
    EXPECT_FALSE(validate_config(tiny_chunks, error));

    app_config negative_delay;
    negative_delay.round_cooldown_ms = -1;
    EXPECT_FALSE(validate_config(negative_delay, error));

    app_config no_timeout;
    no_timeout.read_timeout_seconds = 0;
    EXPECT_FALSE(validate_config(no_timeout, error));
}
