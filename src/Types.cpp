#include "Types.hpp"

#include <fmt/core.h>

// ====================================================================================================
// Preferences
// ====================================================================================================

bool Preferences::isEnabled(Category category) const {
    switch (category) {
        case Category::LANGUAGE: return language_filter;
        case Category::SEXUAL:   return sexual_content_filter;
        case Category::VIOLENCE: return violence_filter;
    }
    throw InvalidConfiguration(fmt::format("unknown category value {}",
                                           static_cast<int>(category)));
}

Sensitivity Preferences::sensitivityFor(Category category) const {
    switch (category) {
        case Category::LANGUAGE: return language_sensitivity;
        case Category::SEXUAL:   return sexual_content_sensitivity;
        case Category::VIOLENCE: return violence_sensitivity;
    }
    throw InvalidConfiguration(fmt::format("unknown category value {}",
                                           static_cast<int>(category)));
}

bool PreferencesUpdate::empty() const {
    return !language_filter && !sexual_content_filter && !violence_filter &&
           !language_sensitivity && !sexual_content_sensitivity && !violence_sensitivity;
}

void PreferencesUpdate::applyTo(Preferences& prefs) const {
    if (language_filter) prefs.language_filter = *language_filter;
    if (sexual_content_filter) prefs.sexual_content_filter = *sexual_content_filter;
    if (violence_filter) prefs.violence_filter = *violence_filter;
    if (language_sensitivity) prefs.language_sensitivity = *language_sensitivity;
    if (sexual_content_sensitivity) prefs.sexual_content_sensitivity = *sexual_content_sensitivity;
    if (violence_sensitivity) prefs.violence_sensitivity = *violence_sensitivity;
}

// ====================================================================================================
// Names
// ====================================================================================================

std::string_view toString(Category category) {
    switch (category) {
        case Category::LANGUAGE: return "language";
        case Category::SEXUAL:   return "sexual";
        case Category::VIOLENCE: return "violence";
    }
    return "unknown";
}

std::string_view toString(Sensitivity sensitivity) {
    switch (sensitivity) {
        case Sensitivity::LOW:    return "low";
        case Sensitivity::MEDIUM: return "medium";
        case Sensitivity::HIGH:   return "high";
    }
    return "unknown";
}

std::string_view toString(Action action) {
    switch (action) {
        case Action::NONE:         return "none";
        case Action::MUTE:         return "mute";
        case Action::FAST_FORWARD: return "fast_forward";
        case Action::SKIP:         return "skip";
    }
    return "unknown";
}

bool parseCategory(std::string_view text, Category& out) {
    if (text == "language") { out = Category::LANGUAGE; return true; }
    if (text == "sexual")   { out = Category::SEXUAL;   return true; }
    if (text == "violence") { out = Category::VIOLENCE; return true; }
    return false;
}

bool parseSensitivity(std::string_view text, Sensitivity& out) {
    if (text == "low")    { out = Sensitivity::LOW;    return true; }
    if (text == "medium") { out = Sensitivity::MEDIUM; return true; }
    if (text == "high")   { out = Sensitivity::HIGH;   return true; }
    return false;
}

bool parseAction(std::string_view text, Action& out) {
    if (text == "none")         { out = Action::NONE;         return true; }
    if (text == "mute")         { out = Action::MUTE;         return true; }
    if (text == "fast_forward") { out = Action::FAST_FORWARD; return true; }
    if (text == "skip")         { out = Action::SKIP;         return true; }
    return false;
}

bool isValid(Category category) {
    return static_cast<size_t>(category) < CATEGORY_COUNT;
}

bool isValid(Sensitivity sensitivity) {
    return static_cast<size_t>(sensitivity) < SENSITIVITY_COUNT;
}
