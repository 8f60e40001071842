#pragma once

#include "device_source.hpp"
#include "ping_prober.hpp"

#include <json/json.h>

#include <cstddef>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct history_point {
    double point_unixtime;
    std::optional<double> point_latency;
    double point_packet_loss;
    std::optional<double> point_jitter;
};

history_point history_point_from_probe(double unixtime, probe_result const &result);

// fixed capacity FIFO: once full each push_back overwrites the oldest point
class history_ring {
  public:
    explicit history_ring(size_t capacity);

    void push_back(history_point const &point);

    [[nodiscard]] size_t size() const { return ring_points.size(); }
    [[nodiscard]] size_t capacity() const { return ring_capacity; }
    [[nodiscard]] bool empty() const { return ring_points.empty(); }

    // 0 is the oldest point
    [[nodiscard]] history_point const &operator[](size_t i) const { return ring_points[(ring_head + i) % ring_points.size()]; }
    [[nodiscard]] history_point const &back() const { return (*this)[size() - 1]; }

  private:
    std::vector<history_point> ring_points;
    size_t ring_head = 0;
    size_t ring_capacity;
};

class history_store {
  public:
    explicit history_store(size_t capacity) : store_capacity(capacity) {}

    void append(std::string const &device_name, history_point const &point);

    // drops every device that is not in current_devices
    void prune(device_set const &current_devices);

    [[nodiscard]] std::map<std::string, history_ring> const &snapshot() const { return store_rings; }

  private:
    size_t store_capacity;
    std::map<std::string, history_ring> store_rings;
};

// {"name": [{"timestamp", "latency", "packet_loss", "jitter"}, ...]}
void history_store_write_json(std::ostream &os, history_store const &store);

// appends the points found in raw, skipping entries that do not have the expected shape
void history_store_load_json(history_store &store, Json::Value const &raw);
