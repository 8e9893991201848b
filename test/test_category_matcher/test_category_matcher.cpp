/*
 * File: test/test_category_matcher/test_category_matcher.cpp
 * Description: Signal counting per category.
 * Verifies word boundaries, case folding, phrase signals and signal file loading.
 */
#include <unity.h>
#include "CategoryMatcher.hpp"

#include <cstdio>
#include <fstream>

// --- Helpers ---

static const char* TMP_SIGNALS = "test_category_matcher_signals.txt";

static void writeFile(const char* path, const char* contents) {
    std::ofstream out(path);
    out << contents;
}

static int sev(const CategoryMatcher::Severities& s, Category c) {
    return s[static_cast<size_t>(c)];
}

// --- Setup ---
void setUp(void) {}
void tearDown(void) {
    std::remove(TMP_SIGNALS);
}

// --- Tests ---

void test_default_sets_are_loaded(void) {
    CategoryMatcher matcher;
    TEST_ASSERT_FALSE(matcher.isEmpty());
    TEST_ASSERT_TRUE(matcher.getSignalCount(Category::LANGUAGE) > 0);
    TEST_ASSERT_TRUE(matcher.getSignalCount(Category::SEXUAL) > 0);
    TEST_ASSERT_TRUE(matcher.getSignalCount(Category::VIOLENCE) > 0);
}

void test_single_profanity(void) {
    CategoryMatcher matcher;
    auto s = matcher.match("this is a damn good scene");

    TEST_ASSERT_EQUAL_INT(1, sev(s, Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::SEXUAL));
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::VIOLENCE));
}

void test_matching_ignores_case(void) {
    CategoryMatcher matcher;
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("DAMN!", Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("Damn.", Category::LANGUAGE));
}

void test_signal_inside_word_does_not_match(void) {
    CategoryMatcher matcher;
    // "hit" in "white", "ass" in "class", "hell" in "hello", "die" in "studies"
    auto s = matcher.match("a white classroom says hello to studies");

    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::VIOLENCE));
}

void test_punctuation_is_a_boundary(void) {
    CategoryMatcher matcher;
    TEST_ASSERT_EQUAL_INT(2, matcher.severity("hell, hell!", Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("(kill)", Category::VIOLENCE));
}

void test_repeated_signal_counts_each_occurrence(void) {
    CategoryMatcher matcher;
    TEST_ASSERT_EQUAL_INT(3, matcher.severity("damn damn damn", Category::LANGUAGE));
}

void test_phrase_counts_on_top_of_keyword(void) {
    CategoryMatcher matcher;
    // "shot" and "shot her"
    TEST_ASSERT_EQUAL_INT(2, matcher.severity("he shot her twice", Category::VIOLENCE));
    // Phrase spans any whitespace run
    TEST_ASSERT_EQUAL_INT(2, matcher.severity("he shot \t  her", Category::VIOLENCE));
}

void test_matched_signals_lists_each_occurrence(void) {
    CategoryMatcher matcher;
    auto found = matcher.matchedSignals("Shot her. Shot him.", Category::VIOLENCE);

    TEST_ASSERT_EQUAL_size_t(4, found.size());
    size_t shots = 0;
    for (const auto& s : found) {
        if (s == "shot") shots++;
    }
    TEST_ASSERT_EQUAL_size_t(2, shots);
}

void test_non_ascii_letters_extend_words(void) {
    CategoryMatcher matcher;
    // "damné" is a longer word; "café" next to a separate "damn" is not
    TEST_ASSERT_EQUAL_INT(0, matcher.severity("damn\xC3\xA9", Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(0, matcher.severity("\xC3\xA9" "damn", Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("caf\xC3\xA9 damn", Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(0, matcher.severity("\xFF\xFE\x80", Category::LANGUAGE));
    // Apostrophe is not a word character
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("the damn's gone", Category::LANGUAGE));
}

void test_empty_text_has_no_severity(void) {
    CategoryMatcher matcher;
    auto s = matcher.match("");
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::SEXUAL));
    TEST_ASSERT_EQUAL_INT(0, sev(s, Category::VIOLENCE));
}

void test_set_signals_normalizes(void) {
    CategoryMatcher matcher;
    matcher.setSignals(Category::LANGUAGE, {"  Heck  ", "Gosh   Darn", ""});

    const auto& signals = matcher.getSignals(Category::LANGUAGE);
    TEST_ASSERT_EQUAL_size_t(2, signals.size());
    TEST_ASSERT_EQUAL_STRING("heck", signals[0].c_str());
    TEST_ASSERT_EQUAL_STRING("gosh darn", signals[1].c_str());
    TEST_ASSERT_EQUAL_INT(2, matcher.severity("heck, GOSH DARN it", Category::LANGUAGE));
}

void test_load_from_file_replaces_sets(void) {
    writeFile(TMP_SIGNALS,
              "# test signals\n"
              "[language]\n"
              "frak\n"
              "\n"
              "[violence]\n"
              "zap\n"
              "zap gun\n"
              "[sexual]\n");

    CategoryMatcher matcher;
    TEST_ASSERT_TRUE(matcher.loadFromFile(TMP_SIGNALS));

    TEST_ASSERT_EQUAL_size_t(1, matcher.getSignalCount(Category::LANGUAGE));
    TEST_ASSERT_EQUAL_size_t(0, matcher.getSignalCount(Category::SEXUAL));
    TEST_ASSERT_EQUAL_size_t(2, matcher.getSignalCount(Category::VIOLENCE));

    auto s = matcher.match("frak! zap gun, damn");
    TEST_ASSERT_EQUAL_INT(1, sev(s, Category::LANGUAGE));  // damn is gone
    TEST_ASSERT_EQUAL_INT(2, sev(s, Category::VIOLENCE));
}

void test_load_rejects_unknown_section_and_keeps_sets(void) {
    writeFile(TMP_SIGNALS, "[gore]\nsplat\n");

    CategoryMatcher matcher;
    size_t before = matcher.getSignalCount(Category::LANGUAGE);

    TEST_ASSERT_FALSE(matcher.loadFromFile(TMP_SIGNALS));
    TEST_ASSERT_EQUAL_size_t(before, matcher.getSignalCount(Category::LANGUAGE));
    TEST_ASSERT_EQUAL_INT(1, matcher.severity("damn", Category::LANGUAGE));
}

void test_load_rejects_signal_outside_section(void) {
    writeFile(TMP_SIGNALS, "damn\n[language]\nheck\n");

    CategoryMatcher matcher;
    TEST_ASSERT_FALSE(matcher.loadFromFile(TMP_SIGNALS));
}

void test_load_missing_file_fails(void) {
    CategoryMatcher matcher;
    TEST_ASSERT_FALSE(matcher.loadFromFile("does/not/exist.txt"));
    TEST_ASSERT_FALSE(matcher.isEmpty());
}

void test_unknown_category_value_throws(void) {
    CategoryMatcher matcher;
    bool thrown = false;
    try {
        matcher.getSignals(static_cast<Category>(7));
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

void test_shipped_signals_file_matches_defaults(void) {
    CategoryMatcher defaults;
    CategoryMatcher loaded;
    TEST_ASSERT_TRUE(loaded.loadFromFile(ISWEEP_CONFIG_DIR "/signals.txt"));

    const Category categories[] = {Category::LANGUAGE, Category::SEXUAL, Category::VIOLENCE};
    for (Category c : categories) {
        TEST_ASSERT_TRUE(defaults.getSignals(c) == loaded.getSignals(c));
    }
}

// --- Runner ---
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_default_sets_are_loaded);
    RUN_TEST(test_single_profanity);
    RUN_TEST(test_matching_ignores_case);
    RUN_TEST(test_signal_inside_word_does_not_match);
    RUN_TEST(test_punctuation_is_a_boundary);
    RUN_TEST(test_repeated_signal_counts_each_occurrence);
    RUN_TEST(test_phrase_counts_on_top_of_keyword);
    RUN_TEST(test_matched_signals_lists_each_occurrence);
    RUN_TEST(test_non_ascii_letters_extend_words);
    RUN_TEST(test_empty_text_has_no_severity);
    RUN_TEST(test_set_signals_normalizes);

    RUN_TEST(test_load_from_file_replaces_sets);
    RUN_TEST(test_load_rejects_unknown_section_and_keeps_sets);
    RUN_TEST(test_load_rejects_signal_outside_section);
    RUN_TEST(test_load_missing_file_fails);
    RUN_TEST(test_unknown_category_value_throws);
    RUN_TEST(test_shipped_signals_file_matches_defaults);

    return UNITY_END();
}
