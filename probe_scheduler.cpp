#include "probe_scheduler.hpp"

#include "device_source.hpp"
#include "escape_json.hpp"
#include "json_file_store.hpp"
#include "now_unixtime.hpp"
#include "str.hpp"
#include "uptimeping_event.hpp"
#include "uptimeping_metrics.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

void snapshot_device_write_json(std::ostream &os, probe_result const &result, std::string const &address) {
    bool first = true;
    os << '{';
    escape_json_key(os, first, "reachable") << escape_json(result.reachable);
    escape_json_key(os, first, "latency") << escape_json(result.latency);
    escape_json_key(os, first, "packet_loss") << escape_json(result.packet_loss);
    escape_json_key(os, first, "jitter") << escape_json(result.jitter);
    escape_json_key(os, first, "packets_sent") << escape_json(result.packets_sent);
    escape_json_key(os, first, "packets_received") << escape_json(result.packets_received);
    escape_json_key(os, first, "ip") << escape_json(address);
    os << '}';
}

probe_scheduler::probe_scheduler(uptimeping_config config, probe_task task)
    : scheduler_config(std::move(config)), scheduler_task(std::move(task)), scheduler_history(scheduler_config.max_history_points),
      scheduler_uptime(scheduler_config.downtime_events_max) {
    if (!scheduler_task) { throw std::invalid_argument("probe_scheduler needs a probe task"); }
}

probe_scheduler::~probe_scheduler() { loop_stop_join(); }

void probe_scheduler::restore_persisted_state() {
    history_store_load_json(scheduler_history, json_file_load(scheduler_config.history_file));
    uptime_tracker_load_json(scheduler_uptime, json_file_load(scheduler_config.uptime_file));
    std::cout << "probe_scheduler::restore_persisted_state devices with history " << scheduler_history.snapshot().size() << ", with uptime "
              << scheduler_uptime.snapshot().size() << std::endl;
}

std::string probe_scheduler::aggregate_outcomes(std::vector<probe_outcome> const &outcomes, double now) {
    std::ostringstream devices_json;
    bool first_device = true;
    for (auto const &outcome : outcomes) {
        if (!outcome.outcome_result) { continue; }
        auto const &result = *outcome.outcome_result;
        try {
            std::ostringstream device_json;
            snapshot_device_write_json(device_json, result, outcome.outcome_address);
            auto point = history_point_from_probe(now, result);

            // history only takes the point once the tracker has counted it
            auto transition = scheduler_uptime.update(outcome.outcome_device_name, result.reachable, now);
            scheduler_history.append(outcome.outcome_device_name, point);
            if (transition) {
                uptimeping_event_log(*transition == device_state::offline ? "device_offline" : "device_online",
                                     str(outcome.outcome_device_name, " ", outcome.outcome_address));
            }
            escape_json_key(devices_json, first_device, outcome.outcome_device_name) << device_json.str();
        } catch (std::exception const &e) {
            std::cerr << "probe_scheduler::aggregate_outcomes " << outcome.outcome_device_name << " dropped: " << e.what() << std::endl;
        }
    }
    if (first_device) { return {}; }

    std::ostringstream snapshot;
    bool first = true;
    snapshot << '{';
    escape_json_key(snapshot, first, "timestamp") << escape_json(iso8601_local(now));
    escape_json_key(snapshot, first, "devices") << '{' << devices_json.str() << '}';
    snapshot << '}';
    return snapshot.str();
}

bool probe_scheduler::run_cycle(double now) {
    auto devices = device_source_load(scheduler_config);
    if (devices.empty()) {
        ++uptimeping_metric().scheduler_cycles_without_devices;
        return false;
    }
    scheduler_history.prune(devices);

    auto outcomes = probe_fanout(devices, scheduler_task, scheduler_config.max_workers);

    auto snapshot = aggregate_outcomes(outcomes, now);
    if (snapshot.empty()) {
        ++uptimeping_metric().snapshot_skipped_empty;
        std::cerr << "probe_scheduler::run_cycle no results for " << devices.size() << " devices, keeping previous snapshot" << std::endl;
    } else if (json_file_save(scheduler_config.snapshot_file, snapshot)) {
        ++uptimeping_metric().snapshot_writes;
    }

    if (now - scheduler_last_flush_unixtime >= scheduler_config.flush_interval_seconds) { flush(now); }
    return true;
}

void probe_scheduler::flush(double now) {
    std::ostringstream history_json;
    history_store_write_json(history_json, scheduler_history);
    std::ostringstream uptime_json;
    uptime_tracker_write_json(uptime_json, scheduler_uptime);

    json_file_save(scheduler_config.history_file, history_json.str());
    json_file_save(scheduler_config.uptime_file, uptime_json.str());
    ++uptimeping_metric().periodic_flushes;
    scheduler_last_flush_unixtime = now;
}

bool probe_scheduler::loop_run_once() {
    auto cycle_started = std::chrono::steady_clock::now();
    try {
        run_cycle(now_unixtime());
    } catch (std::exception const &e) {
        ++uptimeping_metric().scheduler_cycle_exceptions;
        uptimeping_event_log("uptimeping_cycle_exception", e.what());
    }
    ++uptimeping_metric().scheduler_cycles;
    ++scheduler_cycles_run;
    if (scheduler_config.max_cycles && scheduler_cycles_run >= scheduler_config.max_cycles) { return true; }

    auto interval = std::chrono::duration<double>(scheduler_config.ping_interval_seconds);
    auto elapsed = std::chrono::steady_clock::now() - cycle_started;
    return loop_sleep_for(std::max<std::chrono::duration<double>>(interval - elapsed, std::chrono::duration<double>::zero()));
}

void probe_scheduler::loop_stopped() {
    try {
        flush(now_unixtime());
    } catch (std::exception const &e) {
        uptimeping_event_log("uptimeping_final_flush_failed", e.what());
    }
}
