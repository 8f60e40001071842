#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string_view>

struct uptimeping_metric_counter {
    std::atomic<uint64_t> counter_value = 0;

    uptimeping_metric_counter() = default;
    uptimeping_metric_counter(uptimeping_metric_counter const &other) : counter_value(other.counter_value.load()) {}
    uptimeping_metric_counter &operator=(uptimeping_metric_counter const &other) {
        counter_value.store(other.counter_value.load());
        return *this;
    }

    uptimeping_metric_counter &operator++() {
        counter_value.fetch_add(1, std::memory_order_relaxed);
        return *this;
    }
    uint64_t operator-(uptimeping_metric_counter const &c) const { return counter_value.load() - c.counter_value.load(); }
};

struct uptimeping_metrics_struct {
    uptimeping_metric_counter metric_restarts;
    uptimeping_metric_counter scheduler_cycles;
    uptimeping_metric_counter scheduler_cycles_without_devices;
    uptimeping_metric_counter scheduler_cycle_exceptions;
    uptimeping_metric_counter probe_tasks_started;
    uptimeping_metric_counter probe_tasks_failed;
    uptimeping_metric_counter probe_unreachable;
    uptimeping_metric_counter probe_command_timeouts;
    uptimeping_metric_counter snapshot_writes;
    uptimeping_metric_counter snapshot_skipped_empty;
    uptimeping_metric_counter periodic_flushes;
    uptimeping_metric_counter persistence_write_failures;
    uptimeping_metric_counter persistence_read_failures;

    template <typename func> static void metrics_walk(func &&f) {
        f("metric_restarts", [](auto &&s) -> auto const & { return s.metric_restarts; });
        f("scheduler_cycles", [](auto &&s) -> auto const & { return s.scheduler_cycles; });
        f("scheduler_cycles_without_devices", [](auto &&s) -> auto const & { return s.scheduler_cycles_without_devices; });
        f("scheduler_cycle_exceptions", [](auto &&s) -> auto const & { return s.scheduler_cycle_exceptions; });
        f("probe_tasks_started", [](auto &&s) -> auto const & { return s.probe_tasks_started; });
        f("probe_tasks_failed", [](auto &&s) -> auto const & { return s.probe_tasks_failed; });
        f("probe_unreachable", [](auto &&s) -> auto const & { return s.probe_unreachable; });
        f("probe_command_timeouts", [](auto &&s) -> auto const & { return s.probe_command_timeouts; });
        f("snapshot_writes", [](auto &&s) -> auto const & { return s.snapshot_writes; });
        f("snapshot_skipped_empty", [](auto &&s) -> auto const & { return s.snapshot_skipped_empty; });
        f("periodic_flushes", [](auto &&s) -> auto const & { return s.periodic_flushes; });
        f("persistence_write_failures", [](auto &&s) -> auto const & { return s.persistence_write_failures; });
        f("persistence_read_failures", [](auto &&s) -> auto const & { return s.persistence_read_failures; });
    }
};

uptimeping_metrics_struct &uptimeping_metric();
void uptimeping_metrics_report_delta(std::ostream &os, uptimeping_metrics_struct const &current, uptimeping_metrics_struct const &previous);
