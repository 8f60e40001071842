#include "device_source.hpp"

#include "json_file_store.hpp"
#include "ping_prober.hpp"
#include "str.hpp"

#include <iostream>

device_set device_set_from_json(Json::Value const &raw) {
    device_set devices;
    if (!raw.isObject()) {
        if (!raw.isNull()) { std::cerr << "device_set_from_json ignoring non-object device list" << std::endl; }
        return devices;
    }
    for (auto i = raw.begin(); i != raw.end(); ++i) {
        auto name = i.name();
        auto const &value = *i;
        std::string address;
        if (value.isString()) {
            address = value.asString();
        } else if (value.isObject()) {
            // a record without a usable ip stays in the set and is reported unreachable
            if (value["ip"].isString()) { address = value["ip"].asString(); }
        } else {
            std::cerr << "device_set_from_json skipping " << name << " with neither an address nor a record" << std::endl;
            continue;
        }
        if (!probe_address_acceptable(address)) {
            std::cerr << "device_set_from_json " << name << " has unusable address '" << address << "', it will be reported unreachable" << std::endl;
        }
        devices[name] = address;
    }
    return devices;
}

device_set device_set_from_default_devices(std::string_view default_devices) {
    device_set devices;
    for (auto pair : str_split(default_devices, ',')) {
        auto colon = pair.find(':');
        if (colon == std::string_view::npos) { continue; }
        auto name = str_trim(pair.substr(0, colon));
        auto address = str_trim(pair.substr(colon + 1));
        if (name.empty()) { continue; }
        devices[std::string{name}] = std::string{address};
    }
    return devices;
}

device_set device_source_load(uptimeping_config const &config) {
    auto devices = device_set_from_json(json_file_load(config.devices_file));
    if (devices.empty() && !config.default_devices.empty()) { devices = device_set_from_default_devices(config.default_devices); }
    return devices;
}
