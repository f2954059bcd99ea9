#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Minimal harness for tests that must not link gtest (e.g. ones that own main()).

struct TestCase {
    std::string name;
    std::function<void()> func;
};

inline std::vector<TestCase>& get_tests() {
    static std::vector<TestCase> tests;
    return tests;
}

inline void register_test(std::string name, std::function<void()> func) {
    get_tests().push_back({std::move(name), std::move(func)});
}

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    struct Register_##suite##_##name { \
        Register_##suite##_##name() { \
            register_test(#suite "." #name, test_##suite##_##name); \
        } \
    } register_##suite##_##name; \
    void test_##suite##_##name()

class TestFailure : public std::exception {
public:
    explicit TestFailure(std::string msg) : msg_(std::move(msg)) {}
    const char* what() const noexcept override { return msg_.c_str(); }
private:
    std::string msg_;
};

#define TEST_FAIL_AT(what) \
    throw TestFailure(std::string("Assertion failed: ") + what + " at " + __FILE__ + ":" + \
                      std::to_string(__LINE__))

#define ASSERT_TRUE(condition) \
    do { \
        if (!(condition)) { \
            TEST_FAIL_AT(#condition); \
        } \
    } while (0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define ASSERT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            TEST_FAIL_AT(#a " == " #b); \
        } \
    } while (0)

#define ASSERT_NE(a, b) \
    do { \
        if ((a) == (b)) { \
            TEST_FAIL_AT(#a " != " #b); \
        } \
    } while (0)

// Runs every registered test whose name contains `filter` (all when empty).
inline int run_all_tests(const std::string& filter = "") {
    int passed = 0;
    int failed = 0;
    for (const auto& test : get_tests()) {
        if (!filter.empty() && test.name.find(filter) == std::string::npos) {
            continue;
        }
        std::cout << "[ RUN      ] " << test.name << std::endl;
        try {
            test.func();
            std::cout << "[       OK ] " << test.name << std::endl;
            passed++;
        } catch (const TestFailure& e) {
            std::cout << "[  FAILED  ] " << test.name << std::endl;
            std::cout << e.what() << std::endl;
            failed++;
        } catch (const std::exception& e) {
            std::cout << "[  FAILED  ] " << test.name << std::endl;
            std::cout << "Uncaught exception: " << e.what() << std::endl;
            failed++;
        }
    }
    std::cout << "[==========] " << (passed + failed) << " tests ran." << std::endl;
    std::cout << "[  PASSED  ] " << passed << " tests." << std::endl;
    if (failed > 0) {
        std::cout << "[  FAILED  ] " << failed << " tests." << std::endl;
        return 1;
    }
    return 0;
}
