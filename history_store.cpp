#include "history_store.hpp"

#include "escape_json.hpp"
#include "now_unixtime.hpp"

#include <stdexcept>

history_point history_point_from_probe(double unixtime, probe_result const &result) {
    return history_point{unixtime, result.latency, result.packet_loss, result.jitter};
}

history_ring::history_ring(size_t capacity) : ring_capacity(capacity) {
    if (!capacity) { throw std::invalid_argument("history_ring capacity must be positive"); }
}

void history_ring::push_back(history_point const &point) {
    if (ring_points.size() < ring_capacity) {
        ring_points.push_back(point);
        return;
    }
    ring_points[ring_head] = point;
    ring_head = (ring_head + 1) % ring_capacity;
}

void history_store::append(std::string const &device_name, history_point const &point) {
    auto i = store_rings.find(device_name);
    if (i == store_rings.end()) { i = store_rings.emplace(device_name, history_ring{store_capacity}).first; }
    i->second.push_back(point);
}

void history_store::prune(device_set const &current_devices) {
    std::erase_if(store_rings, [&](auto const &item) { return !current_devices.contains(item.first); });
}

void history_store_write_json(std::ostream &os, history_store const &store) {
    bool first_device = true;
    os << '{';
    for (auto const &[name, ring] : store.snapshot()) {
        escape_json_key(os, first_device, name) << '[';
        for (size_t i = 0; ring.size() > i; ++i) {
            auto const &point = ring[i];
            bool first = true;
            if (i) { os << ','; }
            os << '{';
            escape_json_key(os, first, "timestamp") << escape_json(iso8601_local(point.point_unixtime));
            escape_json_key(os, first, "latency") << escape_json(point.point_latency);
            escape_json_key(os, first, "packet_loss") << escape_json(point.point_packet_loss);
            escape_json_key(os, first, "jitter") << escape_json(point.point_jitter);
            os << '}';
        }
        os << ']';
    }
    os << '}';
}

namespace {
std::optional<double> optional_number(Json::Value const &v) {
    if (v.isNumeric()) { return v.asDouble(); }
    return std::nullopt;
}
} // namespace

void history_store_load_json(history_store &store, Json::Value const &raw) {
    if (!raw.isObject()) { return; }
    for (auto device = raw.begin(); device != raw.end(); ++device) {
        if (!device->isArray()) { continue; }
        for (auto const &entry : *device) {
            if (!entry.isObject() || !entry["timestamp"].isString()) { continue; }
            auto unixtime = unixtime_from_iso8601_local(entry["timestamp"].asString());
            if (!unixtime) { continue; }
            auto loss = optional_number(entry["packet_loss"]);
            store.append(device.name(), history_point{*unixtime, optional_number(entry["latency"]), loss ? *loss : 100.0, optional_number(entry["jitter"])});
        }
    }
}
