#include "CategoryMatcher.hpp"
#include <fstream>
#include <iostream>

#include "StringUtils.hpp"

using namespace utils;

namespace {

struct SignalSet {
    Category category;
    std::vector<std::string> signals;
};

const std::vector<SignalSet>& defaultSignals() {
    static const std::vector<SignalSet> sets = {
        {Category::LANGUAGE, {
            "damn", "dammit", "goddamn", "hell", "crap", "shit", "shitty", "bullshit",
            "fuck", "fucking", "fucked", "motherfucker", "bitch", "bastard", "ass",
            "asshole", "dick", "piss", "pissed", "prick", "slut", "whore", "cunt", "douche"
        }},
        {Category::SEXUAL, {
            "sex", "sexy", "sexual", "naked", "nude", "nudity", "explicit", "rape",
            "abuse", "intercourse", "seduce", "seduction", "orgasm", "erotic", "porn",
            "topless", "undress", "undressed"
        }},
        {Category::VIOLENCE, {
            "kill", "killed", "killing", "murder", "murdered", "shot", "shoot",
            "shooting", "stab", "stabbed", "blood", "bloody", "violence", "violent",
            "attack", "fight", "gun", "weapon", "death", "die", "dying", "dead",
            "assault", "beat", "beating", "punch", "hit", "torture",
            // Directed phrases score on top of their keywords
            "shot her", "shot him", "beat up", "stabbed him", "stabbed her"
        }},
    };
    return sets;
}

} // namespace

// ====================================================================================================
// Constructor
// ====================================================================================================
CategoryMatcher::CategoryMatcher() {
    loadDefaults();
}

// ====================================================================================================
// Loading
// ====================================================================================================

void CategoryMatcher::loadDefaults() {
    for (const auto& set : defaultSignals()) {
        setSignals(set.category, set.signals);
    }
}

bool CategoryMatcher::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[CategoryMatcher] Failed to open " << filename << "\n";
        return false;
    }

    std::array<std::vector<std::string>, CATEGORY_COUNT> loaded;
    bool have_section = false;
    Category current = Category::LANGUAGE;
    std::string line;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);

        // Skip blank and comment lines
        if (entry.empty() || entry[0] == '#') {
            continue;
        }

        // Section header: [category]
        if (entry.front() == '[') {
            if (entry.back() != ']' ||
                !parseCategory(trim(entry.substr(1, entry.size() - 2)), current)) {
                std::cerr << "[CategoryMatcher] " << filename << ":" << line_no
                          << ": unknown section " << entry << "\n";
                return false;
            }
            have_section = true;
            continue;
        }

        if (!have_section) {
            std::cerr << "[CategoryMatcher] " << filename << ":" << line_no
                      << ": signal outside of a [category] section\n";
            return false;
        }

        std::string signal = normalizeSignal(entry);
        if (signal.empty() || !isWordChar(signal.front()) || !isWordChar(signal.back())) {
            std::cerr << "[CategoryMatcher] " << filename << ":" << line_no
                      << ": signal must start and end with a word character\n";
            return false;
        }
        loaded[static_cast<size_t>(current)].push_back(signal);
    }

    signal_sets = std::move(loaded);

    std::cout << "[CategoryMatcher] Loaded "
              << signal_sets[0].size() + signal_sets[1].size() + signal_sets[2].size()
              << " signals from " << filename << "\n";
    return true;
}

void CategoryMatcher::setSignals(Category category, const std::vector<std::string>& signals) {
    if (!isValid(category)) {
        throw InvalidConfiguration("signal set for unknown category");
    }
    auto& set = signal_sets[static_cast<size_t>(category)];
    set.clear();
    for (const auto& signal : signals) {
        std::string normalized = normalizeSignal(signal);
        if (!normalized.empty()) {
            set.push_back(normalized);
        }
    }
}

const std::vector<std::string>& CategoryMatcher::getSignals(Category category) const {
    if (!isValid(category)) {
        throw InvalidConfiguration("signal set for unknown category");
    }
    return signal_sets[static_cast<size_t>(category)];
}

bool CategoryMatcher::isEmpty() const {
    for (const auto& set : signal_sets) {
        if (!set.empty()) {
            return false;
        }
    }
    return true;
}

// ====================================================================================================
// Matching
// ====================================================================================================

CategoryMatcher::Severities CategoryMatcher::match(const std::string& text) const {
    Severities severities{};
    if (text.empty()) {
        return severities;
    }

    std::string lower_text = toLower(text);
    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        for (const auto& signal : signal_sets[i]) {
            severities[i] += countOccurrences(lower_text, signal);
        }
    }
    return severities;
}

int CategoryMatcher::severity(const std::string& text, Category category) const {
    std::string lower_text = toLower(text);
    int total = 0;
    for (const auto& signal : getSignals(category)) {
        total += countOccurrences(lower_text, signal);
    }
    return total;
}

std::vector<std::string> CategoryMatcher::matchedSignals(const std::string& text,
                                                         Category category) const {
    std::vector<std::string> matches;
    std::string lower_text = toLower(text);
    for (const auto& signal : getSignals(category)) {
        int count = countOccurrences(lower_text, signal);
        matches.insert(matches.end(), static_cast<size_t>(count), signal);
    }
    return matches;
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::string CategoryMatcher::normalizeSignal(const std::string& signal) {
    std::string lower = toLower(trim(signal));
    std::string out;
    out.reserve(lower.size());
    for (char c : lower) {
        if (isSpace(c)) {
            if (!out.empty() && out.back() != ' ') {
                out.push_back(' ');
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

int CategoryMatcher::countOccurrences(const std::string& lower_text, const std::string& signal) {
    if (signal.empty() || lower_text.size() < signal.size()) {
        return 0;
    }

    int count = 0;
    size_t pos = lower_text.find(signal.front());
    while (pos != std::string::npos) {
        // Left boundary
        if (pos == 0 || !isWordChar(lower_text[pos - 1])) {
            size_t end = matchAt(lower_text, pos, signal);
            // Right boundary
            if (end != std::string::npos &&
                (end == lower_text.size() || !isWordChar(lower_text[end]))) {
                ++count;
                pos = lower_text.find(signal.front(), end);
                continue;
            }
        }
        pos = lower_text.find(signal.front(), pos + 1);
    }
    return count;
}

size_t CategoryMatcher::matchAt(const std::string& lower_text, size_t pos, const std::string& signal) {
    size_t t = pos;
    for (char c : signal) {
        if (c == ' ') {
            if (t >= lower_text.size() || !isSpace(lower_text[t])) {
                return std::string::npos;
            }
            while (t < lower_text.size() && isSpace(lower_text[t])) {
                ++t;
            }
            continue;
        }
        if (t >= lower_text.size() || lower_text[t] != c) {
            return std::string::npos;
        }
        ++t;
    }
    return t;
}
