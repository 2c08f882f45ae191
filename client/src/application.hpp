#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "net/authenticated_transport.hpp"
#include "transfer/work_item.hpp"
#include "util/cancellation.hpp"

enum class exit_code {
    success = 0,
    fatal = 1,
    usage = 2,
    round_limit = 3,
    cancelled = 130,
};

class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    int run(int argc, char** argv);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application() = default;
    ~application() = default;

    app_config m_config;
    cancellation_token m_cancel;

    enum class parse_result {
        proceed,
        help,
        invalid,
    };

    parse_result parse_arguments(int argc, char** argv);
    bool prompt_credentials();
    void start_signal_watcher();
    std::vector<work_item> build_manifest(authenticated_transport& transport);

    static void print_usage(const char* prog);
};
