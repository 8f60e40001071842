#pragma once

#include "device_source.hpp"
#include "ping_prober.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct probe_outcome {
    std::string outcome_device_name;
    std::string outcome_address;
    std::optional<probe_result> outcome_result; // empty when the task threw
    std::string outcome_error;
};

using probe_task = std::function<probe_result(std::string const &address)>;

probe_task probe_task_for(std::shared_ptr<ping_prober> prober);

// Runs task once for every device on at most max_workers threads, the calling
// thread included, and returns once all of them have finished. An exception
// from one task is recorded in that device's outcome and does not affect the
// others. Outcomes are in device name order whatever order tasks completed in.
std::vector<probe_outcome> probe_fanout(device_set const &devices, probe_task const &task, int max_workers);
