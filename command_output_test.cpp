#include "command_output.hpp"
#include "uptimeping_test.hpp"

#include <chrono>

TEST(command_output_suite, captures_stdout) {
    auto output = command_output_with_deadline({"echo", "hello", "world"}, 5);
    uptimeping_test_check(output.has_value(), ==, true);
    uptimeping_test_check(output.value_or(""), ==, "hello world\n");
}

TEST(command_output_suite, stderr_is_discarded) {
    auto output = command_output_with_deadline({"sh", "-c", "echo visible; echo hidden >&2"}, 5);
    uptimeping_test_check(output.value_or(""), ==, "visible\n");
}

TEST(command_output_suite, deadline_kills_child) {
    auto started = std::chrono::steady_clock::now();
    auto output = command_output_with_deadline({"sleep", "10"}, 0.3);
    auto took = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    uptimeping_test_check(output.has_value(), ==, false);
    uptimeping_test_check(took, <, 5.0);
}

TEST(command_output_suite, missing_program_throws) {
    bool thrown = false;
    try {
        command_output_with_deadline({"/nonexistent/uptimeping_program"}, 1);
    } catch (errno_exception const &e) {
        thrown = true;
        std::cout << "missing_program_throws " << e.what() << std::endl;
    }
    uptimeping_test_check(thrown, ==, true);
}
