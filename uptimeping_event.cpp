#include "uptimeping_event.hpp"

#include "env.hpp"
#include "escape_json.hpp"
#include "now_unixtime.hpp"

#include <mutex>
#include <utility>

std::ostream &operator<<(std::ostream &os, uptimeping_event const &event) {
    bool first = true;
    os << '{';
    escape_json_key(os, first, "event_unixtime") << escape_json(event.event_unixtime);
    escape_json_key(os, first, "event_name") << escape_json(event.event_name);
    escape_json_key(os, first, "event_compilation_timestamp") << escape_json(__DATE__ " " __TIME__);
    escape_json_key(os, first, "event_message") << escape_json(event.event_message);
    return os << '}';
}

locked_reference<std::deque<uptimeping_event>> &uptimeping_event_log() {
    static locked_holder<std::deque<uptimeping_event>> event_log;
    return event_log;
}

void uptimeping_event_log(std::string_view event_name, std::string_view event_message) {
    static std::mutex stdout_mutex;
    uptimeping_event event{now_unixtime(), std::string{event_name}, std::string{event_message}};
    {
        std::lock_guard _{stdout_mutex};
        std::cout << event << std::endl;
    }
    write_locked_reference log(uptimeping_event_log());
    log->push_back(std::move(event));
    while (std::cmp_greater(log->size(), env("uptimeping_event_log_max", 1024))) {
        log->pop_front();
    }
}
