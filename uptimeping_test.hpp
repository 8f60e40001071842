#pragma once

#include "call_errno.hpp"
#include "env.hpp"
#include "str.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

std::vector<std::pair<std::string, std::function<void()>>> &uptimeping_tests();
extern std::vector<std::string> uptimeping_test_failures;

template <typename... arg_types> inline void uptimeping_test_fail(arg_types &&...args) {
    auto s = str(args...);
    std::cout << "uptimeping_test_fail " << s << std::endl;
    uptimeping_test_failures.push_back(s);

    auto failures_max = env("uptimeping_test_failures_max", 10);
    if (std::cmp_greater_equal(uptimeping_test_failures.size(), failures_max)) {
        throw std::runtime_error(str("Too many test failures: ", uptimeping_test_failures.size(), " last was ", s));
    }
}

#define uptimeping_test_check(a, cmp, b, ...)                                                                                                                  \
    do {                                                                                                                                                       \
        auto lhs = a;                                                                                                                                          \
        auto rhs = b;                                                                                                                                          \
        if (!(lhs cmp rhs)) {                                                                                                                                  \
            uptimeping_test_fail(__FILE__, ":", __LINE__, " ", #a, "=", lhs, " " #cmp " ", #b, "=", rhs __VA_OPT__(, " ", ) __VA_ARGS__);                        \
        }                                                                                                                                                      \
    } while (0)

#define TEST(suite_name, test_name)                                                                                                                            \
    void suite_name##_##test_name();                                                                                                                           \
    namespace {                                                                                                                                                \
    auto uptimeping_test_register_##suite_name##_##test_name = uptimeping_tests().emplace_back(#suite_name "_" #test_name, suite_name##_##test_name);          \
    }                                                                                                                                                          \
    void suite_name##_##test_name()

struct tmpdir {
    std::string tmpdir_name;

    inline tmpdir() {
        tmpdir_name = std::filesystem::temp_directory_path().string() + "/uptimeping_test.XXXXXX";
        CALL_ERRNO_BAD_VALUE(mkdtemp, nullptr, tmpdir_name.data());
    }
    tmpdir(tmpdir const &) = delete;
    tmpdir &operator=(tmpdir const &) = delete;

    [[nodiscard]] inline std::filesystem::path tmpdir_path(std::string const &name) const { return std::filesystem::path(tmpdir_name) / name; }

    inline ~tmpdir() {
        for (const auto &i : std::filesystem::recursive_directory_iterator(tmpdir_name)) {
            std::cout << "tmpdir " << (i.is_regular_file() ? i.file_size() : 0) << '\t' << i.path() << std::endl;
        }
        auto removed_count = std::filesystem::remove_all(tmpdir_name);
        std::cout << "tmpdir cleaned " << tmpdir_name << " " << removed_count << std::endl;
    }
};

inline void uptimeping_test_write_file(std::filesystem::path const &path, std::string const &contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    if (!out.flush()) { throw std::runtime_error(str("uptimeping_test_write_file failed ", path)); }
}

inline std::string uptimeping_test_read_file(std::filesystem::path const &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { throw std::runtime_error(str("uptimeping_test_read_file failed ", path)); }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
