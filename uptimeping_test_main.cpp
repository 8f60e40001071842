#include "uptimeping_test.hpp"

#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <vector>

std::vector<std::pair<std::string, std::function<void()>>> &uptimeping_tests() {
    static std::vector<std::pair<std::string, std::function<void()>>> _;
    return _;
}
std::vector<std::string> uptimeping_test_failures;

int main() {
    // period keys and timestamps are local time
    setenv("TZ", "UTC", 1);
    tzset();

    std::cout << "uptimeping_test_main" << std::endl;
    for (auto &[name, f] : uptimeping_tests()) {
        std::cout << "uptimeping_running_test " << name << std::endl;
        try {
            f();
        } catch (std::exception const &e) {
            uptimeping_test_fail("test_exception in ", name, ": ", e.what());
        } catch (...) {
            uptimeping_test_fail("test_exception unknown_exception in ", name);
            throw;
        }
        std::cout << "uptimeping_test_done " << name << std::endl;
    }
    if (!uptimeping_test_failures.empty()) {
        std::cerr << "uptimeping_test_failures " << uptimeping_test_failures.size() << std::endl;
        return 17;
    }
    std::cout << "uptimeping_test_main all passed!" << std::endl;
    return 0;
}
