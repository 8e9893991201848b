#ifndef USER_STORE_HPP
#define USER_STORE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "PreferencesStore.hpp"

/**
 * UserStore - In-memory users and their filtering preferences
 *
 * Responsibilities:
 * - Create users with default preferences (all filters on, medium sensitivity)
 * - Look up users by id or username
 * - Apply partial preference updates
 *
 * Reads run concurrently; writes are serialized.
 */
class UserStore : public PreferencesStore {
public:
    struct User {
        int64_t user_id = 0;
        std::string username;
        std::string created_at;
    };

    UserStore() = default;

    /**
     * Create a user with default preferences
     *
     * @param username Unique, non-empty username
     * @return The new user, or std::nullopt if the username is taken or empty
     */
    std::optional<User> createUser(const std::string& username);

    std::optional<User> getUser(int64_t user_id) const;

    std::optional<User> findUserByName(const std::string& username) const;

    std::optional<Preferences> getPreferences(int64_t user_id) const override;

    /**
     * Apply a partial update; fields not set in the update keep their value
     *
     * @return Updated preferences, or std::nullopt if the user is unknown
     */
    std::optional<Preferences> updatePreferences(int64_t user_id, const PreferencesUpdate& update);

    size_t userCount() const;

private:
    struct Record {
        User user;
        Preferences preferences;
    };

    mutable std::shared_mutex mutex;
    std::map<int64_t, Record> records;
    std::unordered_map<std::string, int64_t> ids_by_name;
    int64_t next_id = 1;

    static std::string now();
};

#endif // USER_STORE_HPP
