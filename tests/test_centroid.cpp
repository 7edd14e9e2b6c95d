/**
 * Centroid tests
 */

#include "centroid.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

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

static std::shared_ptr<const VectorTable> make_table(const std::string& text) {
    std::istringstream in(text);
    LoadResult r = load_vector_table(in, "<memory>");
    TEST_ASSERT(r.ok(), "Fixture failed to load: " << r.error);
    return r.table;
}

static bool near(float a, float b) {
    return std::fabs(a - b) < 1e-6f;
}

const char* kAnimals =
    "cat 1 2 3\n"
    "dog 3 2 1\n"
    "fish 0 0 6\n";

void test_mean_of_matched_vectors() {
    auto table = make_table(kAnimals);
    auto c = compute_centroid(*table, {"cat", "dog", "fish"});
    TEST_ASSERT(c.has_value(), "Centroid expected");
    TEST_ASSERT(c->size() == table->dim, "Centroid dimension should equal D");
    TEST_ASSERT(near((*c)[0], 4.0f / 3.0f), "c[0] mismatch");
    TEST_ASSERT(near((*c)[1], 4.0f / 3.0f), "c[1] mismatch");
    TEST_ASSERT(near((*c)[2], 10.0f / 3.0f), "c[2] mismatch");
}

void test_single_word_is_its_own_vector() {
    auto table = make_table(kAnimals);
    auto c = compute_centroid(*table, {"dog"});
    TEST_ASSERT(c.has_value(), "Centroid expected");
    TEST_ASSERT(near((*c)[0], 3.0f) && near((*c)[1], 2.0f) && near((*c)[2], 1.0f), "Should equal dog");
}

void test_unknown_words_ignored_and_case_folded() {
    auto table = make_table(kAnimals);
    auto c = compute_centroid(*table, {"CAT", "unicorn", "Dog"});
    TEST_ASSERT(c.has_value(), "Centroid expected");
    TEST_ASSERT(near((*c)[0], 2.0f) && near((*c)[1], 2.0f) && near((*c)[2], 2.0f),
                "Mean of cat and dog expected");
}

void test_duplicates_are_counted() {
    auto table = make_table(kAnimals);
    auto c = compute_centroid(*table, {"cat", "cat", "fish"});
    TEST_ASSERT(c.has_value(), "Centroid expected");
    TEST_ASSERT(near((*c)[0], 2.0f / 3.0f), "cat should count twice");
    TEST_ASSERT(near((*c)[2], 12.0f / 3.0f), "cat should count twice");
}

void test_no_match() {
    auto table = make_table(kAnimals);
    TEST_ASSERT(!compute_centroid(*table, {}).has_value(), "Empty input must be NoMatch");
    TEST_ASSERT(!compute_centroid(*table, {"zzznotaword"}).has_value(), "Unknown word must be NoMatch");
}

void test_non_ascii_words_case_folded() {
    auto table = make_table("über 1 0\nçava 0 2\nzero 0 0\n");
    auto c = compute_centroid(*table, {"Über", "ÇAVA"});
    TEST_ASSERT(c.has_value(), "Capitalised non-ASCII words should match");
    TEST_ASSERT(near((*c)[0], 0.5f) && near((*c)[1], 1.0f), "Mean of über and çava expected");

    TEST_ASSERT(find_missing_words(*table, {"Über", "ÇaVa"}).empty(), "Nothing should be missing");
}

void test_find_missing_words() {
    auto table = make_table(kAnimals);
    auto missing = find_missing_words(*table, {"Cat", "Unicorn", "dog", "yeti", "Unicorn"});
    TEST_ASSERT(missing.size() == 3, "Expected 3 missing, got " << missing.size());
    TEST_ASSERT(missing[0] == "Unicorn" && missing[1] == "yeti" && missing[2] == "Unicorn",
                "Missing words keep input order and spelling");
    TEST_ASSERT(find_missing_words(*table, {"fish"}).empty(), "Nothing should be missing");
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "wordmean centroid tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        RUN_TEST(test_mean_of_matched_vectors);
        RUN_TEST(test_single_word_is_its_own_vector);
        RUN_TEST(test_unknown_words_ignored_and_case_folded);
        RUN_TEST(test_duplicates_are_counted);
        RUN_TEST(test_no_match);
        RUN_TEST(test_non_ascii_words_case_folded);
        RUN_TEST(test_find_missing_words);

        std::cout << "\nALL TESTS PASSED!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED WITH EXCEPTION: " << e.what() << std::endl;
        return 1;
    }
}
