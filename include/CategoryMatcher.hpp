#ifndef CATEGORY_MATCHER_HPP
#define CATEGORY_MATCHER_HPP

#include <array>
#include <string>
#include <vector>

#include "Types.hpp"

/**
 * CategoryMatcher - Counts category signals in caption/transcript text
 *
 * Responsibilities:
 * - Hold one signal set (words and phrases) per category
 * - Load signal sets from a configuration file, or fall back to built-in sets
 * - Count non-overlapping, word-boundary matches per category (case-insensitive)
 */
class CategoryMatcher {
public:
    using Severities = std::array<int, CATEGORY_COUNT>;

    /**
     * Constructor - starts with the built-in signal sets
     */
    CategoryMatcher();

    /**
     * Replace all signal sets with the contents of a signals file
     *
     * Format: "[category]" section headers, one signal per line,
     * lines starting with '#' are comments. On failure the current
     * sets are left untouched.
     *
     * @param filename Path to signals file
     * @return true on success, false if the file cannot be read or is malformed
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Restore the built-in signal sets
     */
    void loadDefaults();

    /**
     * Count matched signals per category
     *
     * A signal matches only on word boundaries, so "hit" does not match
     * inside "white". Each signal counts its own non-overlapping occurrences.
     *
     * @param text Text to scan (any length, may be empty)
     * @return Severity per category, indexed by Category
     */
    Severities match(const std::string& text) const;

    /**
     * Severity of a single category
     */
    int severity(const std::string& text, Category category) const;

    /**
     * List the signals of one category found in text, one entry per occurrence
     */
    std::vector<std::string> matchedSignals(const std::string& text, Category category) const;

    /**
     * Replace one category's signal set (signals are normalized on insert)
     */
    void setSignals(Category category, const std::vector<std::string>& signals);

    const std::vector<std::string>& getSignals(Category category) const;

    size_t getSignalCount(Category category) const { return getSignals(category).size(); }

    bool isEmpty() const;

private:
    std::array<std::vector<std::string>, CATEGORY_COUNT> signal_sets;

    /**
     * Lowercase and collapse internal whitespace to single spaces
     */
    static std::string normalizeSignal(const std::string& signal);

    /**
     * Count occurrences of one normalized signal in lowercased text
     */
    static int countOccurrences(const std::string& lower_text, const std::string& signal);

    /**
     * Try to match signal at pos. A space in the signal matches any
     * whitespace run in the text.
     *
     * @return Index one past the match, or std::string::npos
     */
    static size_t matchAt(const std::string& lower_text, size_t pos, const std::string& signal);
};

#endif // CATEGORY_MATCHER_HPP
