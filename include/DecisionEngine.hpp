#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "CategoryMatcher.hpp"
#include "DecisionResolver.hpp"
#include "Logger.hpp"
#include "PreferencesStore.hpp"
#include "SensitivityEvaluator.hpp"

/**
 * DecisionEngine - Facade that turns (user, text) into a playback decision
 *
 * Workflow:
 * 1. Look up the user's preferences through the PreferencesStore capability
 * 2. CategoryMatcher: severity per category
 * 3. SensitivityEvaluator: outcome per category
 * 4. DecisionResolver: final action and reported category
 *
 * Every failure collapses to action "none" with an explanatory reason; no
 * exception leaves analyze() or decide(). Safe to call from many threads:
 * the matcher and evaluator are never modified after construction.
 */
class DecisionEngine {
public:
    static constexpr std::chrono::milliseconds DEFAULT_LOOKUP_TIMEOUT{500};

    // Bounded lookups still running on helper threads; further lookups fail fast
    static constexpr int MAX_PENDING_LOOKUPS = 64;

    /**
     * Constructor
     * @param store Preferences lookup; shared so a timed-out lookup can finish safely
     * @param matcher Signal sets
     * @param evaluator Action rule table
     * @param lookup_timeout Upper bound for a preferences lookup (0 = call inline, unbounded)
     */
    DecisionEngine(std::shared_ptr<const PreferencesStore> store,
                   CategoryMatcher matcher = CategoryMatcher(),
                   SensitivityEvaluator evaluator = SensitivityEvaluator(),
                   std::chrono::milliseconds lookup_timeout = DEFAULT_LOOKUP_TIMEOUT);

    /**
     * Simple mode: action only. Unknown users and lookup failures yield NONE.
     */
    Action analyze(int64_t user_id, const std::string& text) const;

    /**
     * Structured mode
     *
     * @param user_id User whose preferences apply
     * @param text Caption/transcript text
     * @param confidence Optional caller confidence in [0, 1]; logged by the caller, does not alter matching
     * @return Decision; reason explains the no-action branches
     *         ("No match", "Unknown user", "Preferences unavailable",
     *         "Invalid configuration", "Invalid payload: ...")
     */
    Decision decide(int64_t user_id, const std::string& text,
                    std::optional<double> confidence = std::nullopt) const;

    /**
     * Core decision for known preferences, no lookup involved
     * @throws InvalidConfiguration if the preferences hold out-of-range values
     */
    Decision evaluate(const Preferences& preferences, const std::string& text) const;

    /**
     * Decision returned for a malformed request
     */
    static Decision invalidPayload(const std::string& detail);

    const CategoryMatcher& getMatcher() const { return matcher; }
    const SensitivityEvaluator& getEvaluator() const { return evaluator; }

private:
    enum class LookupStatus {
        FOUND,
        NOT_FOUND,
        UNAVAILABLE
    };

    std::shared_ptr<const PreferencesStore> store;
    const CategoryMatcher matcher;
    const SensitivityEvaluator evaluator;
    const std::chrono::milliseconds lookup_timeout;
    std::shared_ptr<std::atomic<int>> pending_lookups;

    /**
     * Fetch preferences, bounded by lookup_timeout
     *
     * Any exception from the store, std or not, yields UNAVAILABLE.
     *
     * @param user_id User to look up
     * @param out Preferences when FOUND
     * @return Lookup status
     */
    LookupStatus lookupPreferences(int64_t user_id, Preferences& out) const;
};

#endif // DECISION_ENGINE_HPP
