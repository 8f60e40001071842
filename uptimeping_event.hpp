#pragma once

#include "locked_reference.hpp"

#include <deque>
#include <iostream>
#include <string>
#include <string_view>

struct uptimeping_event {
    double event_unixtime;
    std::string event_name;
    std::string event_message;
};

std::ostream &operator<<(std::ostream &os, uptimeping_event const &event);

// most recent events, oldest first; bounded by uptimeping_event_log_max
locked_reference<std::deque<uptimeping_event>> &uptimeping_event_log();
void uptimeping_event_log(std::string_view event_name, std::string_view event_message = "");
