#ifndef SENSITIVITY_EVALUATOR_HPP
#define SENSITIVITY_EVALUATOR_HPP

#include <array>
#include <string>

#include "Types.hpp"

/**
 * SensitivityEvaluator - Turns a category severity into a playback action
 *
 * Responsibilities:
 * - Apply the firing threshold of each sensitivity level
 * - Look up the (action, duration) rule for a (category, sensitivity) pair
 * - Load and validate the rule table
 */
class SensitivityEvaluator {
public:
    /**
     * One entry of the rule table.
     *
     * escalate_at == 0 means the rule has no escalation step.
     */
    struct ActionRule {
        Action action = Action::NONE;
        int duration_seconds = 0;
        int escalate_at = 0;
        Action escalated_action = Action::NONE;
        int escalated_duration_seconds = 0;
        bool defined = false;
    };

    using RuleTable = std::array<std::array<ActionRule, SENSITIVITY_COUNT>, CATEGORY_COUNT>;

    /**
     * Constructor - starts with the built-in rule table
     */
    SensitivityEvaluator();

    /**
     * Constructor - uses the given table
     * @throws InvalidConfiguration if the table fails validation
     */
    explicit SensitivityEvaluator(const RuleTable& table);

    /**
     * Evaluate one category
     *
     * @param category Category being evaluated
     * @param severity Signal count from the matcher
     * @param enabled User's enable flag for the category
     * @param sensitivity User's sensitivity for the category
     * @return Outcome; fires is false when disabled or under threshold
     * @throws InvalidConfiguration for out-of-range category/sensitivity values
     */
    CategoryOutcome evaluate(Category category, int severity,
                             bool enabled, Sensitivity sensitivity) const;

    /**
     * Minimum severity at which a sensitivity level fires
     * @throws InvalidConfiguration for out-of-range values
     */
    static int threshold(Sensitivity sensitivity);

    /**
     * Replace the rule table with the contents of an actions file
     *
     * Each line: <category> <sensitivity> <action> <seconds> [<escalate_at> <action> <seconds>]
     * Lines starting with '#' are comments. Every (category, sensitivity)
     * pair must be present. On failure the current table is left untouched.
     *
     * @param filename Path to actions file
     * @return true on success, false on read, parse or validation failure
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Restore the built-in rule table
     */
    void loadDefaults();

    const ActionRule& getRule(Category category, Sensitivity sensitivity) const;

    /**
     * Check a rule table for internal consistency
     *
     * - every pair defined, with a non-none action and a positive duration
     * - escalation never lowers the action
     * - at every severity a higher sensitivity is never less restrictive
     *
     * @throws InvalidConfiguration describing the first problem found
     */
    static void validate(const RuleTable& table);

    static const RuleTable& defaultTable();

private:
    RuleTable rules;

    /**
     * Action a rule yields at a severity, or NONE below the threshold
     */
    static Action effectiveAction(const ActionRule& rule, Sensitivity sensitivity, int severity);
};

#endif // SENSITIVITY_EVALUATOR_HPP
