#ifndef TYPES_HPP
#define TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Core value types shared by the matcher, evaluator, resolver and facade.
 *
 * Category, Sensitivity and Action are closed enums. Strings from the wire or
 * from configuration files go through the parse functions below, which report
 * failure instead of defaulting.
 */

enum class Category : uint8_t {
    LANGUAGE = 0,
    SEXUAL   = 1,
    VIOLENCE = 2
};

constexpr size_t CATEGORY_COUNT = 3;

// Highest priority first
constexpr std::array<Category, CATEGORY_COUNT> CATEGORY_PRIORITY = {
    Category::SEXUAL,
    Category::VIOLENCE,
    Category::LANGUAGE
};

enum class Sensitivity : uint8_t {
    LOW    = 0,
    MEDIUM = 1,
    HIGH   = 2
};

constexpr size_t SENSITIVITY_COUNT = 3;

// Ordered by restrictiveness: NONE < MUTE < FAST_FORWARD < SKIP
enum class Action : uint8_t {
    NONE         = 0,
    MUTE         = 1,
    FAST_FORWARD = 2,
    SKIP         = 3
};

/**
 * Raised when a category/sensitivity value or a rule table is not usable.
 */
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Per-user filtering preferences
 */
struct Preferences {
    bool language_filter = true;
    bool sexual_content_filter = true;
    bool violence_filter = true;
    Sensitivity language_sensitivity = Sensitivity::MEDIUM;
    Sensitivity sexual_content_sensitivity = Sensitivity::MEDIUM;
    Sensitivity violence_sensitivity = Sensitivity::MEDIUM;

    bool isEnabled(Category category) const;
    Sensitivity sensitivityFor(Category category) const;

    bool operator==(const Preferences&) const = default;
};

/**
 * Partial preferences update: unset fields keep their prior value
 */
struct PreferencesUpdate {
    std::optional<bool> language_filter;
    std::optional<bool> sexual_content_filter;
    std::optional<bool> violence_filter;
    std::optional<Sensitivity> language_sensitivity;
    std::optional<Sensitivity> sexual_content_sensitivity;
    std::optional<Sensitivity> violence_sensitivity;

    bool empty() const;
    void applyTo(Preferences& prefs) const;
};

/**
 * Result of evaluating one category for one text
 */
struct CategoryOutcome {
    bool fires = false;
    Action action = Action::NONE;
    int duration_seconds = 0;
    int severity = 0;
    Sensitivity sensitivity = Sensitivity::MEDIUM;
};

/**
 * Final structured answer for one request
 */
struct Decision {
    Action action = Action::NONE;
    int duration_seconds = 0;
    std::optional<Category> matched_category;
    std::string reason;

    static Decision noAction(const std::string& reason) {
        Decision d;
        d.reason = reason;
        return d;
    }
};

// Wire names
std::string_view toString(Category category);
std::string_view toString(Sensitivity sensitivity);
std::string_view toString(Action action);

bool parseCategory(std::string_view text, Category& out);
bool parseSensitivity(std::string_view text, Sensitivity& out);
bool parseAction(std::string_view text, Action& out);

// Range checks for values that arrived through a cast
bool isValid(Category category);
bool isValid(Sensitivity sensitivity);

inline bool isMoreRestrictive(Action a, Action b) {
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
}

#endif // TYPES_HPP
