#pragma once

#include "history_store.hpp"
#include "loop_thread.hpp"
#include "probe_fanout.hpp"
#include "uptime_tracker.hpp"
#include "uptimeping_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Owns the history and uptime state; only the scheduler thread (or, before
// start(), the constructing thread) touches them.
class probe_scheduler : public loop_thread {
  public:
    probe_scheduler(uptimeping_config config, probe_task task);
    ~probe_scheduler() override;

    void start() { loop_spawn(); }

    // reads history and uptime back from the data dir
    void restore_persisted_state();

    // one probing cycle stamped with now; returns false when there were no devices to probe
    bool run_cycle(double now);

    // writes history and uptime
    void flush(double now);

    [[nodiscard]] history_store const &history() const { return scheduler_history; }
    [[nodiscard]] uptime_tracker const &uptime() const { return scheduler_uptime; }
    [[nodiscard]] uint64_t cycles_run() const { return scheduler_cycles_run; }

  protected:
    bool loop_run_once() override;
    void loop_stopped() override;

  private:
    // serialized snapshot of one cycle, or empty when no device produced a result
    std::string aggregate_outcomes(std::vector<probe_outcome> const &outcomes, double now);

    uptimeping_config scheduler_config;
    probe_task scheduler_task;
    history_store scheduler_history;
    uptime_tracker scheduler_uptime;
    double scheduler_last_flush_unixtime = 0;
    uint64_t scheduler_cycles_run = 0;
};

// {"timestamp", "devices": {name: {reachable, latency, packet_loss, jitter, packets_sent, packets_received, ip}}}
void snapshot_device_write_json(std::ostream &os, probe_result const &result, std::string const &address);
