/**
 * Config tests
 */

#include "config.hpp"
#include <cstdlib>
#include <iostream>

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "ASSERTION FAILED: " << msg << " at line " << __LINE__ << std::endl; \
            std::exit(1); \
        } \
    } while(0)

#define RUN_TEST(name) \
    do { \
        std::cout << "\n[TEST] " << #name << "..." << std::endl; \
        name(); \
        std::cout << "[PASS] " << #name << std::endl; \
    } while(0)

static void clear_env() {
    unsetenv("WORDMEAN_HOST");
    unsetenv("WORDMEAN_PORT");
    unsetenv("WORDMEAN_VECTORS");
    unsetenv("WORDMEAN_THREADS");
    unsetenv("WORDMEAN_ENV");
}

void test_defaults() {
    clear_env();
    char prog[] = "wordmean";
    char* argv[] = {prog};
    Config c = load_config(1, argv);
    TEST_ASSERT(c.host == "0.0.0.0", "host default");
    TEST_ASSERT(c.port == 4001, "port default");
    TEST_ASSERT(c.vectors_path == "glove/glove.6B.300d.txt", "vectors default");
    TEST_ASSERT(c.threads == 4, "threads default");
    TEST_ASSERT(c.environment == "production" && !c.pretty_json, "production is compact");
}

void test_environment_overrides() {
    clear_env();
    setenv("WORDMEAN_PORT", "9000", 1);
    setenv("WORDMEAN_VECTORS", "/data/vec.txt", 1);
    setenv("WORDMEAN_THREADS", "16", 1);
    setenv("WORDMEAN_ENV", "development", 1);

    char prog[] = "wordmean";
    char* argv[] = {prog};
    Config c = load_config(1, argv);
    clear_env();

    TEST_ASSERT(c.port == 9000, "port from env");
    TEST_ASSERT(c.vectors_path == "/data/vec.txt", "vectors from env");
    TEST_ASSERT(c.threads == 16, "threads from env");
    TEST_ASSERT(c.pretty_json, "development enables pretty JSON");
}

void test_arguments_override_environment() {
    clear_env();
    setenv("WORDMEAN_PORT", "9000", 1);

    char prog[] = "wordmean";
    char port[] = "8081";
    char path[] = "small.txt";
    char* argv[] = {prog, port, path};
    Config c = load_config(3, argv);
    clear_env();

    TEST_ASSERT(c.port == 8081, "argv port wins");
    TEST_ASSERT(c.vectors_path == "small.txt", "argv path wins");
}

void test_invalid_values_keep_defaults() {
    Config c;
    TEST_ASSERT(!apply_setting(c, "port", "http"), "non-numeric port");
    TEST_ASSERT(!apply_setting(c, "port", "80x"), "trailing junk");
    TEST_ASSERT(!apply_setting(c, "port", "70000"), "port out of range");
    TEST_ASSERT(!apply_setting(c, "threads", "0"), "zero threads");
    TEST_ASSERT(!apply_setting(c, "environment", "staging"), "unknown environment");
    TEST_ASSERT(!apply_setting(c, "colour", "blue"), "unknown setting");
    TEST_ASSERT(c.port == 4001 && c.threads == 4 && c.environment == "production", "defaults untouched");

    TEST_ASSERT(apply_setting(c, "environment", "development") && c.pretty_json, "development");
    TEST_ASSERT(apply_setting(c, "environment", "production") && !c.pretty_json, "back to production");
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "wordmean config tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        RUN_TEST(test_defaults);
        RUN_TEST(test_environment_overrides);
        RUN_TEST(test_arguments_override_environment);
        RUN_TEST(test_invalid_values_keep_defaults);

        std::cout << "\nALL TESTS PASSED!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED WITH EXCEPTION: " << e.what() << std::endl;
        return 1;
    }
}
