#pragma once

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class device_state {
    unknown,
    online,
    offline,
};

std::string_view device_state_name(device_state state);
std::optional<device_state> device_state_from_name(std::string_view name);

// checks and online counted over one calendar period
struct uptime_window {
    std::string window_key;
    uint64_t window_checks = 0;
    uint64_t window_online = 0;

    // online/checks as a percentage rounded to 2 places; 100 before any check
    [[nodiscard]] double window_pct() const;
};

struct downtime_event {
    double event_start;
    std::optional<double> event_end;
    std::optional<int64_t> event_duration_seconds;
};

struct uptime_record {
    uptime_window record_today;
    uptime_window record_week;
    uptime_window record_month;
    device_state record_state = device_state::unknown;
    std::optional<double> record_last_change;
    std::deque<downtime_event> record_downtime_events; // oldest first; only the last may be open
};

struct uptime_period_keys {
    std::string day_key;   // 2026-10-19
    std::string week_key;  // 2026-W43, ISO year and week
    std::string month_key; // 2026-10
};

uptime_period_keys uptime_period_keys_for(double unixtime);

class uptime_tracker {
  public:
    explicit uptime_tracker(size_t downtime_events_max = 50) : tracker_downtime_events_max(downtime_events_max) {}

    // counts one check; returns the new state when this check changed a known state
    std::optional<device_state> update(std::string const &device_name, bool reachable, double now);

    [[nodiscard]] std::map<std::string, uptime_record> const &snapshot() const { return tracker_records; }
    [[nodiscard]] uptime_record const *find(std::string const &device_name) const;

    // installs a record read back from storage
    void restore(std::string const &device_name, uptime_record record);

  private:
    size_t tracker_downtime_events_max;
    std::map<std::string, uptime_record> tracker_records;
};

void uptime_tracker_write_json(std::ostream &os, uptime_tracker const &tracker);

// restores every well formed device record in raw; malformed parts fall back to defaults
void uptime_tracker_load_json(uptime_tracker &tracker, Json::Value const &raw);
