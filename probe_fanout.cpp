#include "probe_fanout.hpp"

#include "thread_context.hpp"
#include "uptimeping_metrics.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

probe_task probe_task_for(std::shared_ptr<ping_prober> prober) {
    if (!prober) { throw std::invalid_argument("probe_task_for needs a prober"); }
    return [prober = std::move(prober)](std::string const &address) { return prober->probe(address); };
}

std::vector<probe_outcome> probe_fanout(device_set const &devices, probe_task const &task, int max_workers) {
    std::vector<probe_outcome> outcomes;
    outcomes.reserve(devices.size());
    for (auto const &[name, address] : devices) {
        outcomes.push_back(probe_outcome{name, address, std::nullopt, {}});
    }

    std::atomic<size_t> next_outcome = 0;
    auto worker = [&] {
        for (size_t i; (i = next_outcome.fetch_add(1)) < outcomes.size();) {
            auto &outcome = outcomes[i];
            add_thread_context _("device", outcome.outcome_device_name);
            ++uptimeping_metric().probe_tasks_started;
            try {
                outcome.outcome_result = task(outcome.outcome_address);
            } catch (std::exception const &e) {
                ++uptimeping_metric().probe_tasks_failed;
                outcome.outcome_error = e.what();
                std::cerr << "probe_fanout " << outcome.outcome_device_name << " task failed: " << e.what() << std::endl;
            } catch (...) {
                ++uptimeping_metric().probe_tasks_failed;
                outcome.outcome_error = "unknown exception";
                std::cerr << "probe_fanout " << outcome.outcome_device_name << " task failed with an unknown exception" << std::endl;
            }
        }
    };

    auto thread_count = std::min<size_t>(std::max(max_workers, 1), outcomes.size());
    std::vector<std::thread> threads;
    for (size_t t = 1; thread_count > t; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (std::system_error const &e) {
            std::cerr << "probe_fanout continuing with " << threads.size() + 1 << " workers: " << e.what() << std::endl;
            break;
        }
    }
    worker();
    for (auto &thread : threads) {
        thread.join();
    }
    return outcomes;
}
