#include "transfer/round_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <optional>

#include "transfer/manifest.hpp"
#include "util/log.hpp"

scheduler_options::scheduler_options()
    : max_workers(4), round_cooldown(std::chrono::seconds(5)), max_rounds(0) {}

round_scheduler::round_scheduler(item_fetcher& fetcher, const cancellation_token& cancel,
                                 scheduler_options options, sleep_function sleeper)
    : m_fetcher(fetcher), m_cancel(cancel), m_options(options), m_sleep(std::move(sleeper)) {
    if (m_options.max_workers == 0) {
        m_options.max_workers = 1;
    }
    if (!m_sleep) {
        m_sleep = [this](std::chrono::milliseconds delay) { m_cancel.wait_for(delay); };
    }
}

run_summary round_scheduler::run(const std::vector<work_item>& manifest) {
    run_summary summary;
    std::vector<work_item> pending = manifest::deduplicate(manifest);
    if (pending.size() < manifest.size()) {
        LOG_INFO("scheduler", "Removed " << manifest.size() - pending.size()
                                         << " duplicate entries.");
    }

    while (!pending.empty()) {
        if (m_cancel.is_cancelled()) {
            summary.cancelled = true;
            summary.unfinished = pending;
            break;
        }
        if (m_options.max_rounds > 0 && summary.rounds >= m_options.max_rounds) {
            LOG_WARN("scheduler", "Round limit of " << m_options.max_rounds << " reached with "
                                                    << pending.size() << " files outstanding.");
            summary.round_limit_reached = true;
            summary.unfinished = pending;
            break;
        }

        std::size_t round = ++summary.rounds;
        LOG_INFO("scheduler",
                 "--- Round " << round << ": Downloading " << pending.size() << " files ---");
        std::vector<work_item> failed = run_round(round, pending, summary);

        if (m_cancel.is_cancelled()) {
            summary.cancelled = true;
            summary.unfinished = failed;
            break;
        }
        if (failed.empty()) {
            LOG_INFO("scheduler", "All files downloaded successfully!");
            break;
        }

        LOG_INFO("scheduler", "Round " << round << " completed. " << failed.size()
                                       << " files failed or incomplete.");
        if (m_options.max_rounds == 0 || summary.rounds < m_options.max_rounds) {
            LOG_INFO("scheduler", "Retrying failed files in "
                                      << m_options.round_cooldown.count() / 1000.0
                                      << " seconds...");
            m_sleep(m_options.round_cooldown);
        }
        pending = std::move(failed);
    }
    return summary;
}

std::vector<work_item> round_scheduler::run_round(std::size_t round,
                                                  const std::vector<work_item>& pending,
                                                  run_summary& summary) {
    std::vector<std::optional<transfer_outcome>> outcomes(pending.size());
    std::atomic<std::size_t> next_index(0);
    std::mutex outcome_mutex;

    auto worker = [&]() {
        while (!m_cancel.is_cancelled()) {
            std::size_t index = next_index.fetch_add(1);
            if (index >= pending.size()) {
                return;
            }
            transfer_outcome outcome = transfer_outcome::failed("not attempted");
            try {
                outcome = m_fetcher.fetch(pending[index]);
            } catch (const std::exception& e) {
                LOG_ERROR("scheduler", "Exception for " << pending[index].source_url << ": "
                                                        << e.what());
                outcome = transfer_outcome::failed(e.what());
            }
            std::lock_guard<std::mutex> lk(outcome_mutex);
            outcomes[index] = outcome;
        }
    };

    std::size_t worker_count = std::min(m_options.max_workers, pending.size());
    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(std::async(std::launch::async, worker));
    }
    for (auto& future : workers) {
        future.get();
    }

    round_report report{round, 0, 0, 0, 0};
    std::vector<work_item> retry;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (!outcome) {
            // never started because of cancellation
            retry.push_back(pending[i]);
            continue;
        }
        ++report.attempted;
        switch (outcome->status) {
        case transfer_status::completed:
            ++report.completed;
            break;
        case transfer_status::skipped:
            ++report.skipped;
            break;
        case transfer_status::failed:
            ++report.failed;
            ++summary.failure_counts[pending[i]];
            retry.push_back(pending[i]);
            break;
        case transfer_status::cancelled:
            retry.push_back(pending[i]);
            break;
        }
    }
    summary.completed += report.completed;
    summary.skipped += report.skipped;

    if (m_observer) {
        m_observer(report);
    }
    return retry;
}
