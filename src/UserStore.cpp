#include "UserStore.hpp"

#include <chrono>
#include <mutex>

#include <fmt/chrono.h>

// ====================================================================================================
// Writes
// ====================================================================================================

std::optional<UserStore::User> UserStore::createUser(const std::string& username) {
    if (username.empty()) {
        return std::nullopt;
    }

    std::unique_lock lock(mutex);
    if (ids_by_name.count(username) != 0) {
        return std::nullopt;
    }

    Record record;
    record.user.user_id = next_id++;
    record.user.username = username;
    record.user.created_at = now();

    ids_by_name.emplace(username, record.user.user_id);
    auto it = records.emplace(record.user.user_id, record).first;
    return it->second.user;
}

std::optional<Preferences> UserStore::updatePreferences(int64_t user_id,
                                                        const PreferencesUpdate& update) {
    std::unique_lock lock(mutex);
    auto it = records.find(user_id);
    if (it == records.end()) {
        return std::nullopt;
    }
    update.applyTo(it->second.preferences);
    return it->second.preferences;
}

// ====================================================================================================
// Reads
// ====================================================================================================

std::optional<UserStore::User> UserStore::getUser(int64_t user_id) const {
    std::shared_lock lock(mutex);
    auto it = records.find(user_id);
    if (it == records.end()) {
        return std::nullopt;
    }
    return it->second.user;
}

std::optional<UserStore::User> UserStore::findUserByName(const std::string& username) const {
    std::shared_lock lock(mutex);
    auto it = ids_by_name.find(username);
    if (it == ids_by_name.end()) {
        return std::nullopt;
    }
    return records.at(it->second).user;
}

std::optional<Preferences> UserStore::getPreferences(int64_t user_id) const {
    std::shared_lock lock(mutex);
    auto it = records.find(user_id);
    if (it == records.end()) {
        return std::nullopt;
    }
    return it->second.preferences;
}

size_t UserStore::userCount() const {
    std::shared_lock lock(mutex);
    return records.size();
}

std::string UserStore::now() {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                       std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}
