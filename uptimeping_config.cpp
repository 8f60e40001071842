#include "uptimeping_config.hpp"

#include "env.hpp"

namespace {
std::filesystem::path in_data_dir(std::filesystem::path const &data_dir, char const *var, std::string const &default_name) {
    std::filesystem::path p = env(var, default_name);
    if (p.is_absolute()) { return p; }
    return data_dir / p;
}
} // namespace

uptimeping_config uptimeping_config_from_env() {
    uptimeping_config config;
    config.ping_count = env_at_least("PING_COUNT", config.ping_count, 1);
    config.ping_timeout_seconds = env("PING_TIMEOUT", config.ping_timeout_seconds);
    if (!(config.ping_timeout_seconds > 0)) { config.ping_timeout_seconds = 0.5; }
    config.ping_interval_seconds = env_at_least("PING_INTERVAL", config.ping_interval_seconds, 0.0);
    config.max_history_points = env_at_least<uint64_t>("MAX_HISTORY_POINTS", config.max_history_points, 1);
    config.max_workers = env_at_least("MAX_WORKERS", config.max_workers, 1);

    config.data_dir = env("uptimeping_data_dir", config.data_dir.string());
    config.devices_file = in_data_dir(config.data_dir, "uptimeping_devices_file", config.devices_file.string());
    config.snapshot_file = in_data_dir(config.data_dir, "uptimeping_snapshot_file", config.snapshot_file.string());
    config.history_file = in_data_dir(config.data_dir, "uptimeping_history_file", config.history_file.string());
    config.uptime_file = in_data_dir(config.data_dir, "uptimeping_uptime_file", config.uptime_file.string());

    config.flush_interval_seconds = env_at_least("uptimeping_flush_interval_seconds", config.flush_interval_seconds, 0.0);
    config.downtime_events_max = env_at_least<uint64_t>("uptimeping_downtime_events_max", config.downtime_events_max, 1);
    config.probe_method = env("uptimeping_probe_method", config.probe_method);
    config.ping_command = env("uptimeping_ping_command", config.ping_command);
    config.probe_overhead_seconds = env_at_least("uptimeping_probe_overhead_seconds", config.probe_overhead_seconds, 0.0);
    config.pcap_interface = env("uptimeping_pcap_interface", config.pcap_interface);
    config.metrics_report_seconds = env_at_least("uptimeping_metrics_report_seconds", config.metrics_report_seconds, 0.0);
    config.max_cycles = env("uptimeping_max_cycles", config.max_cycles);
    config.default_devices = env("DEFAULT_DEVICES", config.default_devices);
    return config;
}

std::ostream &operator<<(std::ostream &os, uptimeping_config const &config) {
    return os << "count=" << config.ping_count << " timeout=" << config.ping_timeout_seconds << "s interval=" << config.ping_interval_seconds
              << "s history=" << config.max_history_points << " workers=" << config.max_workers << " method=" << config.probe_method
              << " data_dir=" << config.data_dir;
}
