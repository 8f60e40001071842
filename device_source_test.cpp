#include "device_source.hpp"
#include "json_file_store.hpp"
#include "uptimeping_test.hpp"

#include <sstream>

namespace {
uptimeping_config config_in(tmpdir const &dir) {
    uptimeping_config config;
    config.data_dir = dir.tmpdir_name;
    config.devices_file = dir.tmpdir_path("devices.json");
    return config;
}

Json::Value json_value_from_text(std::string const &text) {
    Json::Value value;
    std::istringstream in{text};
    in >> value;
    return value;
}
} // namespace

TEST(device_source_suite, both_entry_shapes) {
    tmpdir dir;
    auto config = config_in(dir);
    uptimeping_test_write_file(config.devices_file, R"({
        "router": "192.168.1.1",
        "nas": {"ip": "192.168.1.20", "added": "2026-01-01T00:00:00"},
        "no_ip": {"name": "x"},
        "number": 42,
        "option": "-f",
        "spaced": "10.0.0.1 -c 100"
    })");
    auto devices = device_source_load(config);
    uptimeping_test_check(devices.size(), ==, 5u);
    uptimeping_test_check(devices["router"], ==, "192.168.1.1");
    uptimeping_test_check(devices["nas"], ==, "192.168.1.20");
    uptimeping_test_check(devices.contains("no_ip"), ==, true);
    uptimeping_test_check(devices["no_ip"], ==, "");
    uptimeping_test_check(devices.contains("number"), ==, false);
    // kept as given; the prober refuses them
    uptimeping_test_check(devices["option"], ==, "-f");
    uptimeping_test_check(devices["spaced"], ==, "10.0.0.1 -c 100");
}

TEST(device_source_suite, record_with_blank_ip_kept) {
    auto devices = device_set_from_json(json_value_from_text(R"({"nas": {"ip": "", "room": "attic"}, "tv": {"ip": 17}})"));
    uptimeping_test_check(devices.size(), ==, 2u);
    uptimeping_test_check(devices["nas"], ==, "");
    uptimeping_test_check(devices["tv"], ==, "");
}

TEST(device_source_suite, missing_or_malformed_file_is_empty) {
    tmpdir dir;
    auto config = config_in(dir);
    uptimeping_test_check(device_source_load(config).empty(), ==, true);

    uptimeping_test_write_file(config.devices_file, R"({"router": )");
    uptimeping_test_check(device_source_load(config).empty(), ==, true);

    uptimeping_test_write_file(config.devices_file, R"(["192.168.1.1"])");
    uptimeping_test_check(device_source_load(config).empty(), ==, true);
}

TEST(device_source_suite, default_devices_fill_in_for_empty_file) {
    tmpdir dir;
    auto config = config_in(dir);
    config.default_devices = " router : 192.168.1.1 ,bad, printer:192.168.1.30,:10.0.0.9,opt:-x";
    auto devices = device_source_load(config);
    uptimeping_test_check(devices.size(), ==, 3u);
    uptimeping_test_check(devices["router"], ==, "192.168.1.1");
    uptimeping_test_check(devices["printer"], ==, "192.168.1.30");
    uptimeping_test_check(devices["opt"], ==, "-x");

    uptimeping_test_write_file(config.devices_file, R"({"nas": "192.168.1.20"})");
    devices = device_source_load(config);
    uptimeping_test_check(devices.size(), ==, 1u);
    uptimeping_test_check(devices.contains("nas"), ==, true);
}
