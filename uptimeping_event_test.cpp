#include "uptimeping_event.hpp"
#include "uptimeping_test.hpp"

#include <sstream>

TEST(uptimeping_event_suite, event_log_test) {
    uptimeping_event_log("test_event_name", "test_event_message");

    read_locked_reference log(uptimeping_event_log());
    uint64_t count = 0;
    for (auto &&entry : *log) {
        if (entry.event_name == "test_event_name" && entry.event_message == "test_event_message") { ++count; }
    }
    uptimeping_test_check(count, >, 0u);
}

TEST(uptimeping_event_suite, event_log_bounded) {
    setenv("uptimeping_event_log_max", "5", 1);
    for (int i = 0; i < 20; ++i) { uptimeping_event_log("test_event_flood", str(i)); }
    unsetenv("uptimeping_event_log_max");

    auto log = locked_copy(uptimeping_event_log());
    uptimeping_test_check(log.size(), ==, 5u);
    uptimeping_test_check(log.front().event_message, ==, "15");
    uptimeping_test_check(log.back().event_message, ==, "19");
}

TEST(uptimeping_event_suite, event_json_escaped) {
    std::ostringstream os;
    os << uptimeping_event{1.5, "quote\"name", "line\nbreak"};
    auto written = os.str();
    uptimeping_test_check(written.find(R"("event_unixtime":1.5)") != std::string::npos, ==, true);
    uptimeping_test_check(written.find(R"("event_name":"quote\"name")") != std::string::npos, ==, true);
    uptimeping_test_check(written.find(R"("event_message":"line\nbreak")") != std::string::npos, ==, true);
}
