#include "json_file_store.hpp"
#include "uptime_tracker.hpp"
#include "uptimeping_test.hpp"

#include <sstream>

namespace {
// 2026-10-19 12:00:00 UTC, a Monday
constexpr double monday_noon = 1792411200;
constexpr double day = 24 * 3600;

Json::Value parse_json(std::string const &text) {
    tmpdir dir;
    auto path = dir.tmpdir_path("parsed.json");
    uptimeping_test_write_file(path, text);
    return json_file_load(path, Json::Value());
}
} // namespace

TEST(uptime_tracker_suite, period_keys) {
    auto keys = uptime_period_keys_for(monday_noon);
    uptimeping_test_check(keys.day_key, ==, "2026-10-19");
    uptimeping_test_check(keys.week_key, ==, "2026-W43");
    uptimeping_test_check(keys.month_key, ==, "2026-10");

    // ISO week year differs from the calendar year at the turn of the year
    auto new_year = uptime_period_keys_for(1798761600);
    uptimeping_test_check(new_year.day_key, ==, "2027-01-01");
    uptimeping_test_check(new_year.week_key, ==, "2026-W53");
}

TEST(uptime_tracker_suite, percentage_rounding) {
    uptimeping_test_check(uptime_window{}.window_pct(), ==, 100.0);
    uptimeping_test_check((uptime_window{"k", 3, 2}.window_pct()), ==, 66.67);
    uptimeping_test_check((uptime_window{"k", 3, 1}.window_pct()), ==, 33.33);
    uptimeping_test_check((uptime_window{"k", 4, 4}.window_pct()), ==, 100.0);
    uptimeping_test_check((uptime_window{"k", 7, 0}.window_pct()), ==, 0.0);
}

TEST(uptime_tracker_suite, first_check_sets_state_without_transition) {
    uptime_tracker tracker;
    auto transition = tracker.update("router", true, monday_noon);
    uptimeping_test_check(transition.has_value(), ==, false);

    auto record = tracker.find("router");
    uptimeping_test_check(record != nullptr, ==, true);
    uptimeping_test_check(device_state_name(record->record_state), ==, "online");
    uptimeping_test_check(record->record_last_change.has_value(), ==, false);
    uptimeping_test_check(record->record_downtime_events.empty(), ==, true);
    uptimeping_test_check(record->record_today.window_checks, ==, 1u);
    uptimeping_test_check(record->record_today.window_online, ==, 1u);

    uptime_tracker offline_first;
    uptimeping_test_check(offline_first.update("nas", false, monday_noon).has_value(), ==, false);
    uptimeping_test_check(offline_first.find("nas")->record_downtime_events.empty(), ==, true);
}

TEST(uptime_tracker_suite, outage_opens_and_closes_event) {
    uptime_tracker tracker;
    tracker.update("router", true, monday_noon);
    auto down = tracker.update("router", false, monday_noon + 10);
    uptimeping_test_check(down.has_value(), ==, true);
    uptimeping_test_check(device_state_name(down.value_or(device_state::unknown)), ==, "offline");

    auto record = tracker.find("router");
    uptimeping_test_check(record->record_downtime_events.size(), ==, 1u);
    uptimeping_test_check(record->record_downtime_events.back().event_end.has_value(), ==, false);
    uptimeping_test_check(record->record_last_change.value_or(0), ==, monday_noon + 10);

    uptimeping_test_check(tracker.update("router", false, monday_noon + 20).has_value(), ==, false);
    auto up = tracker.update("router", true, monday_noon + 75.5);
    uptimeping_test_check(device_state_name(up.value_or(device_state::unknown)), ==, "online");

    record = tracker.find("router");
    uptimeping_test_check(record->record_downtime_events.size(), ==, 1u);
    auto const &event = record->record_downtime_events.back();
    uptimeping_test_check(event.event_start, ==, monday_noon + 10);
    uptimeping_test_check(event.event_end.value_or(0), ==, monday_noon + 75.5);
    uptimeping_test_check(event.event_duration_seconds.value_or(-1), ==, 65);
    uptimeping_test_check(record->record_today.window_checks, ==, 4u);
    uptimeping_test_check(record->record_today.window_online, ==, 2u);
    uptimeping_test_check(record->record_today.window_pct(), ==, 50.0);
}

TEST(uptime_tracker_suite, windows_reset_on_new_period) {
    uptime_tracker tracker;
    tracker.update("router", false, monday_noon);
    tracker.update("router", true, monday_noon + 1);
    tracker.update("router", true, monday_noon + day);

    auto record = tracker.find("router");
    uptimeping_test_check(record->record_today.window_key, ==, "2026-10-20");
    uptimeping_test_check(record->record_today.window_checks, ==, 1u);
    uptimeping_test_check(record->record_week.window_key, ==, "2026-W43");
    uptimeping_test_check(record->record_week.window_checks, ==, 3u);
    uptimeping_test_check(record->record_week.window_online, ==, 2u);

    tracker.update("router", true, monday_noon + 7 * day);
    record = tracker.find("router");
    uptimeping_test_check(record->record_week.window_key, ==, "2026-W44");
    uptimeping_test_check(record->record_week.window_checks, ==, 1u);
    uptimeping_test_check(record->record_month.window_checks, ==, 4u);
    uptimeping_test_check(record->record_month.window_online <= record->record_month.window_checks, ==, true);
}

TEST(uptime_tracker_suite, downtime_events_are_capped) {
    uptime_tracker tracker{50};
    double now = monday_noon;
    tracker.update("flaky", true, now);
    for (int i = 0; i < 60; ++i) {
        tracker.update("flaky", false, now += 1);
        tracker.update("flaky", true, now += 1);
    }
    auto const &events = tracker.find("flaky")->record_downtime_events;
    uptimeping_test_check(events.size(), ==, 50u);
    // the ten oldest outages were evicted
    uptimeping_test_check(events.front().event_start, ==, monday_noon + 21);
    for (auto const &event : events) {
        uptimeping_test_check(event.event_end.has_value(), ==, true);
        uptimeping_test_check(event.event_duration_seconds.value_or(-1), ==, 1);
    }

    tracker.update("flaky", false, now += 1);
    uptimeping_test_check(events.size(), ==, 50u);
    uptimeping_test_check(events.back().event_end.has_value(), ==, false);
}

TEST(uptime_tracker_suite, json_written_and_restored) {
    uptime_tracker tracker;
    tracker.update("router", true, monday_noon);
    tracker.update("router", false, monday_noon + 5);
    tracker.update("printer", true, monday_noon);

    std::ostringstream written;
    uptime_tracker_write_json(written, tracker);
    auto raw = parse_json(written.str());
    uptimeping_test_check(raw["router"]["today"]["date"].asString(), ==, "2026-10-19");
    uptimeping_test_check(raw["router"]["week"]["key"].asString(), ==, "2026-W43");
    uptimeping_test_check(raw["router"]["today"]["pct"].asDouble(), ==, 50.0);
    uptimeping_test_check(raw["router"]["current_state"].asString(), ==, "offline");
    uptimeping_test_check(raw["router"]["last_change"].asString(), ==, "2026-10-19T12:00:05.000000");
    uptimeping_test_check(raw["router"]["downtime_events"].size(), ==, 1u);
    uptimeping_test_check(raw["router"]["downtime_events"][0]["end"].isNull(), ==, true);
    uptimeping_test_check(raw["router"]["downtime_events"][0]["duration_sec"].isNull(), ==, true);
    uptimeping_test_check(raw["printer"]["last_change"].isNull(), ==, true);

    uptime_tracker restored;
    uptime_tracker_load_json(restored, raw);
    auto record = restored.find("router");
    uptimeping_test_check(record != nullptr, ==, true);
    uptimeping_test_check(device_state_name(record->record_state), ==, "offline");
    uptimeping_test_check(record->record_today.window_checks, ==, 2u);

    // the restored open outage closes on recovery
    restored.update("router", true, monday_noon + 65);
    record = restored.find("router");
    uptimeping_test_check(record->record_downtime_events.size(), ==, 1u);
    uptimeping_test_check(record->record_downtime_events.back().event_duration_seconds.value_or(-1), ==, 60);
}

TEST(uptime_tracker_suite, restore_tolerates_damage) {
    auto raw = parse_json(R"({
        "ok": {"today": {"date": "2026-10-19", "checks": 2, "online": 9}, "current_state": "online",
               "downtime_events": [{"start": "garbage"}, {"start": "2026-10-19T10:00:00.000000", "end": null, "duration_sec": null},
                                   {"start": "2026-10-19T11:00:00.000000", "end": "2026-10-19T11:00:30.000000", "duration_sec": 30}]},
        "weird": 17,
        "partial": {"current_state": "sideways"}
    })");
    uptime_tracker tracker;
    uptime_tracker_load_json(tracker, raw);

    auto ok = tracker.find("ok");
    uptimeping_test_check(ok != nullptr, ==, true);
    uptimeping_test_check(ok->record_today.window_online, ==, 2u);
    // an open event that is not the latest cannot be open
    uptimeping_test_check(ok->record_downtime_events.size(), ==, 1u);
    uptimeping_test_check(ok->record_downtime_events.front().event_duration_seconds.value_or(-1), ==, 30);

    uptimeping_test_check(tracker.find("weird") == nullptr, ==, true);
    auto partial = tracker.find("partial");
    uptimeping_test_check(partial != nullptr, ==, true);
    uptimeping_test_check(device_state_name(partial->record_state), ==, "unknown");
    uptimeping_test_check(partial->record_today.window_pct(), ==, 100.0);
}
