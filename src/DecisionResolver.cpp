#include "DecisionResolver.hpp"

#include <fmt/core.h>

Decision DecisionResolver::resolve(const Outcomes& outcomes) {
    Decision decision;
    std::string also;

    for (Category category : CATEGORY_PRIORITY) {
        const CategoryOutcome& outcome = outcomes[static_cast<size_t>(category)];
        // A NONE action never reports a category
        if (!outcome.fires || outcome.action == Action::NONE) {
            continue;
        }

        if (!decision.matched_category) {
            // Highest-priority firing category is the one reported
            decision.matched_category = category;
            decision.reason = describe(category, outcome);
        } else {
            also += also.empty() ? "" : ",";
            also += toString(category);
        }

        // Most restrictive action wins; equal actions keep the longer duration
        if (isMoreRestrictive(outcome.action, decision.action) ||
            (outcome.action == decision.action &&
             outcome.duration_seconds > decision.duration_seconds)) {
            decision.action = outcome.action;
            decision.duration_seconds = outcome.duration_seconds;
        }
    }

    if (!decision.matched_category) {
        return Decision::noAction("No match");
    }

    if (!also.empty()) {
        decision.reason += "; also=" + also;
    }
    return decision;
}

std::string DecisionResolver::describe(Category category, const CategoryOutcome& outcome) {
    return fmt::format("{} content detected; sensitivity={}; severity={}",
                       toString(category), toString(outcome.sensitivity), outcome.severity);
}
