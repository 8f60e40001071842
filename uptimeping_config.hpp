#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

struct uptimeping_config {
    int ping_count = 5;
    double ping_timeout_seconds = 0.5;
    double ping_interval_seconds = 2;
    uint64_t max_history_points = 1800;
    int max_workers = 10;

    std::filesystem::path data_dir = "data/";
    std::filesystem::path devices_file = "devices.json";
    std::filesystem::path snapshot_file = "ping_data.json";
    std::filesystem::path history_file = "ping_history.json";
    std::filesystem::path uptime_file = "uptime_stats.json";

    double flush_interval_seconds = 10;
    uint64_t downtime_events_max = 50;
    std::string probe_method = "ping_command";
    std::string ping_command = "ping";
    double probe_overhead_seconds = 5;
    std::string pcap_interface = "any";
    double metrics_report_seconds = 60;
    uint64_t max_cycles = 0;
    std::string default_devices;

    // upper bound on the wall time a single device probe may take
    [[nodiscard]] double probe_budget_seconds() const { return ping_count * ping_timeout_seconds + probe_overhead_seconds; }
};

// reads the environment; relative file names are resolved against the data dir
uptimeping_config uptimeping_config_from_env();

std::ostream &operator<<(std::ostream &os, uptimeping_config const &config);
