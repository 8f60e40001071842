#include "call_errno.hpp"
#include "now_unixtime.hpp"
#include "probe_scheduler.hpp"
#include "str.hpp"
#include "uptimeping_config.hpp"
#include "uptimeping_data_dir.hpp"
#include "uptimeping_event.hpp"
#include "uptimeping_metrics.hpp"

#include <sys/resource.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <utility>

volatile std::sig_atomic_t global_exit_value;

void signal_callback_handler(int signum) { global_exit_value = signum; }

namespace {
// each probe in flight holds a pipe or a capture handle
void unlimit_open_files() {
    struct rlimit limits;
    CALL_ERRNO_MINUS_1(getrlimit, RLIMIT_NOFILE, &limits);
    if (limits.rlim_cur < limits.rlim_max) { std::cerr << "increasing RLIMIT_NOFILE from " << limits.rlim_cur << " to " << limits.rlim_max << std::endl; }
    limits.rlim_cur = limits.rlim_max;
    CALL_ERRNO_MINUS_1(setrlimit, RLIMIT_NOFILE, &limits);
}
} // namespace

int main_actions() {
    CALL_ERRNO_BAD_VALUE(signal, SIG_ERR, SIGINT, signal_callback_handler);
    CALL_ERRNO_BAD_VALUE(signal, SIG_ERR, SIGTERM, signal_callback_handler);

    auto config = uptimeping_config_from_env();
    std::cout << "uptimeping_main " << config << std::endl;
    uptimeping_data_dir_prepare(config.data_dir);
    unlimit_open_files();

    uptimeping_metrics_struct last_metric = uptimeping_metric();
    ++uptimeping_metric().metric_restarts;
    double last_metrics_report = now_unixtime();

    probe_scheduler scheduler{config, probe_task_for(ping_prober_from_config(config))};
    scheduler.restore_persisted_state();
    scheduler.start();

    while (!global_exit_value && !scheduler.loop_has_finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = now_unixtime();
        if (now > last_metrics_report + config.metrics_report_seconds) {
            last_metrics_report = now;
            uptimeping_metrics_struct current_metric = uptimeping_metric();
            uptimeping_metrics_report_delta(std::cout, current_metric, last_metric);
            last_metric = std::move(current_metric);
        }
    }
    if (global_exit_value) { std::cout << "uptimeping_main stopping on signal " << global_exit_value << std::endl; }
    scheduler.loop_stop_join();
    return 0;
}

int main() {
    int exit_value = 7;
    uptimeping_event_log("uptimeping_init");
    try {
        exit_value = main_actions();
    } catch (const std::exception &e) {
        uptimeping_event_log("uptimeping_exception", e.what());
        exit_value = 11;
    }
    uptimeping_event_log("uptimeping_exit", str("exit_value ", exit_value, " signal ", static_cast<int>(global_exit_value)));
    return exit_value;
}
