#include "uptime_tracker.hpp"

#include "escape_json.hpp"
#include "now_unixtime.hpp"

#include <algorithm>
#include <cmath>

std::string_view device_state_name(device_state state) {
    switch (state) {
        case device_state::online:
            return "online";
        case device_state::offline:
            return "offline";
        case device_state::unknown:
            break;
    }
    return "unknown";
}

std::optional<device_state> device_state_from_name(std::string_view name) {
    if (name == "online") { return device_state::online; }
    if (name == "offline") { return device_state::offline; }
    if (name == "unknown") { return device_state::unknown; }
    return std::nullopt;
}

double uptime_window::window_pct() const {
    if (!window_checks) { return 100.0; }
    return std::round(static_cast<double>(window_online) / window_checks * 100.0 * 100.0) / 100.0;
}

uptime_period_keys uptime_period_keys_for(double unixtime) {
    return uptime_period_keys{
            strftime_local(unixtime, "%Y-%m-%d"),
            strftime_local(unixtime, "%G-W%V"),
            strftime_local(unixtime, "%Y-%m"),
    };
}

namespace {
void roll_and_count(uptime_window &window, std::string const &key, bool reachable) {
    if (window.window_key != key) {
        window = uptime_window{key};
    }
    ++window.window_checks;
    if (reachable) { ++window.window_online; }
}
} // namespace

std::optional<device_state> uptime_tracker::update(std::string const &device_name, bool reachable, double now) {
    auto keys = uptime_period_keys_for(now);
    auto &record = tracker_records[device_name];

    roll_and_count(record.record_today, keys.day_key, reachable);
    roll_and_count(record.record_week, keys.week_key, reachable);
    roll_and_count(record.record_month, keys.month_key, reachable);

    auto new_state = reachable ? device_state::online : device_state::offline;
    std::optional<device_state> transition;
    if (record.record_state != device_state::unknown && record.record_state != new_state) {
        transition = new_state;
        record.record_last_change = now;
        auto &events = record.record_downtime_events;
        if (new_state == device_state::offline) {
            events.push_back(downtime_event{now, std::nullopt, std::nullopt});
        } else if (!events.empty() && !events.back().event_end) {
            auto &open = events.back();
            open.event_end = now;
            open.event_duration_seconds = static_cast<int64_t>(std::max(0.0, now - open.event_start));
        }
        while (events.size() > tracker_downtime_events_max) {
            events.pop_front();
        }
    }
    record.record_state = new_state;
    return transition;
}

uptime_record const *uptime_tracker::find(std::string const &device_name) const {
    auto i = tracker_records.find(device_name);
    if (i == tracker_records.end()) { return nullptr; }
    return &i->second;
}

void uptime_tracker::restore(std::string const &device_name, uptime_record record) {
    while (record.record_downtime_events.size() > tracker_downtime_events_max) {
        record.record_downtime_events.pop_front();
    }
    tracker_records[device_name] = std::move(record);
}

namespace {
void write_window(std::ostream &os, uptime_window const &window, char const *key_name) {
    bool first = true;
    os << '{';
    escape_json_key(os, first, key_name) << escape_json(window.window_key);
    escape_json_key(os, first, "checks") << escape_json(window.window_checks);
    escape_json_key(os, first, "online") << escape_json(window.window_online);
    escape_json_key(os, first, "pct") << escape_json(window.window_pct());
    os << '}';
}

std::optional<std::string> optional_iso8601(std::optional<double> unixtime) {
    if (!unixtime) { return std::nullopt; }
    return iso8601_local(*unixtime);
}
} // namespace

void uptime_tracker_write_json(std::ostream &os, uptime_tracker const &tracker) {
    bool first_device = true;
    os << '{';
    for (auto const &[name, record] : tracker.snapshot()) {
        bool first = true;
        escape_json_key(os, first_device, name) << '{';
        escape_json_key(os, first, "today");
        write_window(os, record.record_today, "date");
        escape_json_key(os, first, "week");
        write_window(os, record.record_week, "key");
        escape_json_key(os, first, "month");
        write_window(os, record.record_month, "key");
        escape_json_key(os, first, "current_state") << escape_json(device_state_name(record.record_state));
        escape_json_key(os, first, "last_change") << escape_json(optional_iso8601(record.record_last_change));
        escape_json_key(os, first, "downtime_events") << '[';
        bool first_event = true;
        for (auto const &event : record.record_downtime_events) {
            bool first_field = true;
            if (!first_event) { os << ','; }
            first_event = false;
            os << '{';
            escape_json_key(os, first_field, "start") << escape_json(iso8601_local(event.event_start));
            escape_json_key(os, first_field, "end") << escape_json(optional_iso8601(event.event_end));
            escape_json_key(os, first_field, "duration_sec");
            if (event.event_duration_seconds) {
                os << escape_json(*event.event_duration_seconds);
            } else {
                os << "null";
            }
            os << '}';
        }
        os << "]}";
    }
    os << '}';
}

namespace {
uint64_t count_from(Json::Value const &v) {
    if (v.isUInt64()) { return v.asUInt64(); }
    return 0;
}

uptime_window window_from(Json::Value const &raw, char const *key_name) {
    uptime_window window;
    if (!raw.isObject()) { return window; }
    if (raw[key_name].isString()) { window.window_key = raw[key_name].asString(); }
    window.window_checks = count_from(raw["checks"]);
    window.window_online = std::min(count_from(raw["online"]), window.window_checks);
    return window;
}

std::optional<double> optional_unixtime_from(Json::Value const &v) {
    if (!v.isString()) { return std::nullopt; }
    return unixtime_from_iso8601_local(v.asString());
}
} // namespace

void uptime_tracker_load_json(uptime_tracker &tracker, Json::Value const &raw) {
    if (!raw.isObject()) { return; }
    for (auto device = raw.begin(); device != raw.end(); ++device) {
        auto const &entry = *device;
        if (!entry.isObject()) { continue; }

        uptime_record record;
        record.record_today = window_from(entry["today"], "date");
        record.record_week = window_from(entry["week"], "key");
        record.record_month = window_from(entry["month"], "key");
        if (entry["current_state"].isString()) {
            record.record_state = device_state_from_name(entry["current_state"].asString()).value_or(device_state::unknown);
        }
        record.record_last_change = optional_unixtime_from(entry["last_change"]);

        auto const &events = entry["downtime_events"];
        if (events.isArray()) {
            for (auto const &e : events) {
                if (!e.isObject()) { continue; }
                auto start = optional_unixtime_from(e["start"]);
                if (!start) { continue; }
                downtime_event event{*start, optional_unixtime_from(e["end"]), std::nullopt};
                if (event.event_end) {
                    event.event_duration_seconds = e["duration_sec"].isInt64() ? e["duration_sec"].asInt64()
                                                                                : static_cast<int64_t>(std::max(0.0, *event.event_end - *start));
                }
                record.record_downtime_events.push_back(event);
            }
        }
        // an open event can only be the latest one, and only while the device is offline
        auto &loaded = record.record_downtime_events;
        for (size_t i = 0; loaded.size() > i;) {
            bool open = !loaded[i].event_end;
            bool may_stay_open = i + 1 == loaded.size() && record.record_state == device_state::offline;
            if (open && !may_stay_open) {
                loaded.erase(loaded.begin() + i);
            } else {
                ++i;
            }
        }
        tracker.restore(device.name(), std::move(record));
    }
}
