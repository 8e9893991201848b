#ifndef DECISION_RESOLVER_HPP
#define DECISION_RESOLVER_HPP

#include <array>
#include <string>

#include "Types.hpp"

/**
 * DecisionResolver - Combines per-category outcomes into one decision
 *
 * Only firing outcomes are considered. The reported category follows the
 * fixed priority sexual > violence > language; the applied action is the
 * most restrictive one among all firing categories. Those two can come from
 * different categories.
 */
class DecisionResolver {
public:
    using Outcomes = std::array<CategoryOutcome, CATEGORY_COUNT>;

    /**
     * Resolve outcomes (indexed by Category) into a decision
     *
     * @param outcomes Outcome per category
     * @return Decision; action NONE with reason "No match" when nothing fires
     */
    static Decision resolve(const Outcomes& outcomes);

    /**
     * Reason text for a single firing category
     * e.g. "language content detected; sensitivity=medium; severity=1"
     */
    static std::string describe(Category category, const CategoryOutcome& outcome);

private:
    DecisionResolver() = delete;
};

#endif // DECISION_RESOLVER_HPP
