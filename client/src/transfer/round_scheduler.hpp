#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <vector>

#include "transfer/work_item.hpp"
#include "util/cancellation.hpp"

struct scheduler_options {
    std::size_t max_workers;
    std::chrono::milliseconds round_cooldown;
    // 0 retries failed items until they succeed
    std::size_t max_rounds;

    scheduler_options();
};

struct round_report {
    std::size_t round;
    std::size_t attempted;
    std::size_t completed;
    std::size_t skipped;
    std::size_t failed;
};

struct run_summary {
    std::size_t rounds = 0;
    std::size_t completed = 0;
    std::size_t skipped = 0;
    std::map<work_item, std::size_t> failure_counts;
    // Items still to do when the run ended early
    std::vector<work_item> unfinished;
    bool cancelled = false;
    bool round_limit_reached = false;

    bool succeeded() const {
        return unfinished.empty() && !cancelled && !round_limit_reached;
    }
};

// Runs the manifest through a bounded pool of workers, then keeps re-running
// only the items that failed, pausing between rounds, until none fail.
class round_scheduler {
public:
    using sleep_function = std::function<void(std::chrono::milliseconds)>;
    using round_observer = std::function<void(const round_report&)>;

    round_scheduler(item_fetcher& fetcher, const cancellation_token& cancel,
                    scheduler_options options = scheduler_options(),
                    sleep_function sleeper = nullptr);

    void set_round_observer(round_observer observer) {
        m_observer = std::move(observer);
    }

    run_summary run(const std::vector<work_item>& manifest);

private:
    item_fetcher& m_fetcher;
    const cancellation_token& m_cancel;
    scheduler_options m_options;
    sleep_function m_sleep;
    round_observer m_observer;

    // Returns the items that must be attempted again.
    std::vector<work_item> run_round(std::size_t round, const std::vector<work_item>& pending,
                                     run_summary& summary);
};
