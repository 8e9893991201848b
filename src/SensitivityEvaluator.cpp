#include "SensitivityEvaluator.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

#include <fmt/core.h>

#include "StringUtils.hpp"

using namespace utils;

namespace {

SensitivityEvaluator::ActionRule rule(Action action, int seconds) {
    SensitivityEvaluator::ActionRule r;
    r.action = action;
    r.duration_seconds = seconds;
    r.defined = true;
    return r;
}

SensitivityEvaluator::ActionRule rule(Action action, int seconds,
                                      int escalate_at, Action escalated, int escalated_seconds) {
    SensitivityEvaluator::ActionRule r = rule(action, seconds);
    r.escalate_at = escalate_at;
    r.escalated_action = escalated;
    r.escalated_duration_seconds = escalated_seconds;
    return r;
}

bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

// ====================================================================================================
// Constructors
// ====================================================================================================
SensitivityEvaluator::SensitivityEvaluator() {
    loadDefaults();
}

SensitivityEvaluator::SensitivityEvaluator(const RuleTable& table) {
    validate(table);
    rules = table;
}

// ====================================================================================================
// Rule Table
// ====================================================================================================

const SensitivityEvaluator::RuleTable& SensitivityEvaluator::defaultTable() {
    // Indexed [category][sensitivity]: low, medium, high
    static const RuleTable table = {{
        // language
        {{ rule(Action::MUTE, 3),
           rule(Action::MUTE, 4),
           rule(Action::MUTE, 5, 3, Action::FAST_FORWARD, 5) }},
        // sexual
        {{ rule(Action::MUTE, 10, 3, Action::SKIP, 30),
           rule(Action::MUTE, 10, 2, Action::SKIP, 30),
           rule(Action::SKIP, 30) }},
        // violence
        {{ rule(Action::FAST_FORWARD, 10),
           rule(Action::FAST_FORWARD, 10),
           rule(Action::FAST_FORWARD, 15, 3, Action::SKIP, 20) }},
    }};
    return table;
}

void SensitivityEvaluator::loadDefaults() {
    rules = defaultTable();
}

const SensitivityEvaluator::ActionRule& SensitivityEvaluator::getRule(Category category,
                                                                      Sensitivity sensitivity) const {
    if (!isValid(category)) {
        throw InvalidConfiguration(fmt::format("unknown category value {}",
                                               static_cast<int>(category)));
    }
    if (!isValid(sensitivity)) {
        throw InvalidConfiguration(fmt::format("unknown sensitivity value {}",
                                               static_cast<int>(sensitivity)));
    }
    const ActionRule& r = rules[static_cast<size_t>(category)][static_cast<size_t>(sensitivity)];
    if (!r.defined) {
        throw InvalidConfiguration(fmt::format("no action rule for {}/{}",
                                               toString(category), toString(sensitivity)));
    }
    return r;
}

int SensitivityEvaluator::threshold(Sensitivity sensitivity) {
    switch (sensitivity) {
        case Sensitivity::LOW:    return 2;
        case Sensitivity::MEDIUM: return 1;
        case Sensitivity::HIGH:   return 1;
    }
    throw InvalidConfiguration(fmt::format("unknown sensitivity value {}",
                                           static_cast<int>(sensitivity)));
}

// ====================================================================================================
// Evaluation
// ====================================================================================================

CategoryOutcome SensitivityEvaluator::evaluate(Category category, int severity,
                                               bool enabled, Sensitivity sensitivity) const {
    // Lookup first so a bad value is reported even for disabled categories
    const ActionRule& r = getRule(category, sensitivity);

    CategoryOutcome outcome;
    outcome.severity = severity;
    outcome.sensitivity = sensitivity;

    if (!enabled || severity < threshold(sensitivity)) {
        return outcome;
    }

    outcome.fires = true;
    if (r.escalate_at > 0 && severity >= r.escalate_at) {
        outcome.action = r.escalated_action;
        outcome.duration_seconds = r.escalated_duration_seconds;
    } else {
        outcome.action = r.action;
        outcome.duration_seconds = r.duration_seconds;
    }
    return outcome;
}

Action SensitivityEvaluator::effectiveAction(const ActionRule& r, Sensitivity sensitivity, int severity) {
    if (severity < threshold(sensitivity)) {
        return Action::NONE;
    }
    if (r.escalate_at > 0 && severity >= r.escalate_at) {
        return r.escalated_action;
    }
    return r.action;
}

void SensitivityEvaluator::validate(const RuleTable& table) {
    int max_severity = threshold(Sensitivity::LOW);

    for (size_t c = 0; c < CATEGORY_COUNT; ++c) {
        auto category = static_cast<Category>(c);
        for (size_t s = 0; s < SENSITIVITY_COUNT; ++s) {
            auto sensitivity = static_cast<Sensitivity>(s);
            const ActionRule& r = table[c][s];
            std::string where = fmt::format("{}/{}", toString(category), toString(sensitivity));

            if (!r.defined) {
                throw InvalidConfiguration("missing action rule for " + where);
            }
            if (r.action == Action::NONE || r.duration_seconds <= 0) {
                throw InvalidConfiguration("action rule for " + where +
                                           " needs a non-none action and a positive duration");
            }
            if (r.escalate_at < 0) {
                throw InvalidConfiguration("negative escalation severity for " + where);
            }
            if (r.escalate_at > 0) {
                if (r.escalated_duration_seconds <= 0 ||
                    isMoreRestrictive(r.action, r.escalated_action)) {
                    throw InvalidConfiguration("escalation for " + where +
                                               " must not lower the action");
                }
                max_severity = std::max(max_severity, r.escalate_at);
            }
        }
    }

    // Higher sensitivity must never be strictly less restrictive at any severity
    for (size_t c = 0; c < CATEGORY_COUNT; ++c) {
        for (int severity = 1; severity <= max_severity; ++severity) {
            for (size_t s = 1; s < SENSITIVITY_COUNT; ++s) {
                Action lower = effectiveAction(table[c][s - 1], static_cast<Sensitivity>(s - 1), severity);
                Action higher = effectiveAction(table[c][s], static_cast<Sensitivity>(s), severity);
                if (isMoreRestrictive(lower, higher)) {
                    throw InvalidConfiguration(fmt::format(
                        "{}: {} yields {} but {} yields {} at severity {}",
                        toString(static_cast<Category>(c)),
                        toString(static_cast<Sensitivity>(s)), toString(higher),
                        toString(static_cast<Sensitivity>(s - 1)), toString(lower),
                        severity));
                }
            }
        }
    }
}

// ====================================================================================================
// File Loading
// ====================================================================================================

bool SensitivityEvaluator::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[SensitivityEvaluator] Failed to open " << filename << "\n";
        return false;
    }

    RuleTable loaded{};
    std::string line;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }

        std::vector<std::string> fields = splitWhitespace(entry);
        Category category = Category::LANGUAGE;
        Sensitivity sensitivity = Sensitivity::MEDIUM;
        ActionRule r;

        bool ok = (fields.size() == 4 || fields.size() == 7) &&
                  parseCategory(fields[0], category) &&
                  parseSensitivity(fields[1], sensitivity) &&
                  parseAction(fields[2], r.action) &&
                  parseInt(fields[3], r.duration_seconds);
        if (ok && fields.size() == 7) {
            ok = parseInt(fields[4], r.escalate_at) &&
                 parseAction(fields[5], r.escalated_action) &&
                 parseInt(fields[6], r.escalated_duration_seconds);
        }
        if (!ok) {
            std::cerr << "[SensitivityEvaluator] " << filename << ":" << line_no
                      << ": malformed rule '" << entry << "'\n";
            return false;
        }

        ActionRule& slot = loaded[static_cast<size_t>(category)][static_cast<size_t>(sensitivity)];
        if (slot.defined) {
            std::cerr << "[SensitivityEvaluator] " << filename << ":" << line_no
                      << ": duplicate rule for " << toString(category)
                      << "/" << toString(sensitivity) << "\n";
            return false;
        }
        r.defined = true;
        slot = r;
    }

    try {
        validate(loaded);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "[SensitivityEvaluator] " << filename << ": " << e.what() << "\n";
        return false;
    }

    rules = loaded;
    std::cout << "[SensitivityEvaluator] Loaded action rules from " << filename << "\n";
    return true;
}
