#pragma once

#include "uptimeping_config.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <string_view>

// device name -> address, re-read every cycle
using device_set = std::map<std::string, std::string>;

// accepts {"name": "10.0.0.1"} and {"name": {"ip": "10.0.0.1", ...}} entries alike; a
// record without a string ip keeps its name with an empty address
device_set device_set_from_json(Json::Value const &raw);

// "name:address,name:address"
device_set device_set_from_default_devices(std::string_view default_devices);

device_set device_source_load(uptimeping_config const &config);
