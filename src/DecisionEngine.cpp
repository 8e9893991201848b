#include "DecisionEngine.hpp"

#include <cmath>
#include <future>
#include <iostream>
#include <system_error>
#include <thread>

#include <fmt/core.h>

// ====================================================================================================
// Constructor
// ====================================================================================================
DecisionEngine::DecisionEngine(std::shared_ptr<const PreferencesStore> store,
                               CategoryMatcher matcher,
                               SensitivityEvaluator evaluator,
                               std::chrono::milliseconds lookup_timeout)
    : store(std::move(store)),
      matcher(std::move(matcher)),
      evaluator(std::move(evaluator)),
      lookup_timeout(lookup_timeout),
      pending_lookups(std::make_shared<std::atomic<int>>(0)) {

    if (this->matcher.isEmpty()) {
        std::cerr << "[DecisionEngine] Warning: No signals loaded, every text will pass.\n";
    }
}

// ====================================================================================================
// Entry Points
// ====================================================================================================

Action DecisionEngine::analyze(int64_t user_id, const std::string& text) const {
    return decide(user_id, text).action;
}

Decision DecisionEngine::decide(int64_t user_id, const std::string& text,
                                std::optional<double> confidence) const {
    if (confidence && (std::isnan(*confidence) || *confidence < 0.0 || *confidence > 1.0)) {
        return invalidPayload("confidence must be between 0 and 1");
    }

    Preferences preferences;
    switch (lookupPreferences(user_id, preferences)) {
        case LookupStatus::NOT_FOUND:
            return Decision::noAction("Unknown user");
        case LookupStatus::UNAVAILABLE:
            return Decision::noAction("Preferences unavailable");
        case LookupStatus::FOUND:
            break;
    }

    try {
        return evaluate(preferences, text);
    } catch (const InvalidConfiguration& e) {
        Logger("engine").logError(fmt::format("user {}: invalid configuration: {}", user_id, e.what()));
        return Decision::noAction("Invalid configuration");
    }
}

Decision DecisionEngine::evaluate(const Preferences& preferences, const std::string& text) const {
    CategoryMatcher::Severities severities = matcher.match(text);

    DecisionResolver::Outcomes outcomes;
    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        auto category = static_cast<Category>(i);
        outcomes[i] = evaluator.evaluate(category, severities[i],
                                         preferences.isEnabled(category),
                                         preferences.sensitivityFor(category));
    }

    return DecisionResolver::resolve(outcomes);
}

Decision DecisionEngine::invalidPayload(const std::string& detail) {
    return Decision::noAction("Invalid payload: " + detail);
}

// ====================================================================================================
// Preferences Lookup
// ====================================================================================================

DecisionEngine::LookupStatus DecisionEngine::lookupPreferences(int64_t user_id, Preferences& out) const {
    if (!store) {
        return LookupStatus::UNAVAILABLE;
    }

    std::optional<Preferences> found;

    try {
        if (lookup_timeout.count() <= 0) {
            found = store->getPreferences(user_id);
        } else {
            if (pending_lookups->fetch_add(1) >= MAX_PENDING_LOOKUPS) {
                pending_lookups->fetch_sub(1);
                Logger("engine").logError(fmt::format("preferences lookup for user {} refused: {} lookups still pending",
                                                      user_id, MAX_PENDING_LOOKUPS));
                return LookupStatus::UNAVAILABLE;
            }

            // Run the read on a helper thread that holds its own reference to
            // the store, so it may outlive this call after a timeout
            auto promise = std::make_shared<std::promise<std::optional<Preferences>>>();
            std::future<std::optional<Preferences>> result = promise->get_future();
            std::shared_ptr<const PreferencesStore> store_ref = store;
            std::shared_ptr<std::atomic<int>> pending = pending_lookups;

            try {
                std::thread([store_ref, promise, pending, user_id]() {
                    try {
                        promise->set_value(store_ref->getPreferences(user_id));
                    } catch (...) {
                        promise->set_exception(std::current_exception());
                    }
                    pending->fetch_sub(1);
                }).detach();
            } catch (const std::system_error&) {
                pending_lookups->fetch_sub(1);
                throw;
            }

            if (result.wait_for(lookup_timeout) != std::future_status::ready) {
                Logger("engine").logError(fmt::format("preferences lookup for user {} timed out after {} ms",
                                                      user_id, lookup_timeout.count()));
                return LookupStatus::UNAVAILABLE;
            }
            found = result.get();
        }
    } catch (const std::exception& e) {
        Logger("engine").logError(fmt::format("preferences lookup for user {} failed: {}",
                                              user_id, e.what()));
        return LookupStatus::UNAVAILABLE;
    } catch (...) {
        Logger("engine").logError(fmt::format("preferences lookup for user {} failed: unknown exception",
                                              user_id));
        return LookupStatus::UNAVAILABLE;
    }

    if (!found) {
        return LookupStatus::NOT_FOUND;
    }
    out = *found;
    return LookupStatus::FOUND;
}
