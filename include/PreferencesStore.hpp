#ifndef PREFERENCES_STORE_HPP
#define PREFERENCES_STORE_HPP

#include <cstdint>
#include <optional>

#include "Types.hpp"

/**
 * PreferencesStore - Read capability the decision engine depends on
 *
 * Implementations must allow concurrent calls.
 */
class PreferencesStore {
public:
    virtual ~PreferencesStore() = default;

    /**
     * @param user_id User to look up
     * @return The user's preferences, or std::nullopt if the user is unknown
     */
    virtual std::optional<Preferences> getPreferences(int64_t user_id) const = 0;
};

#endif // PREFERENCES_STORE_HPP
