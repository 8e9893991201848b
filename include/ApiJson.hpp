#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "Types.hpp"

namespace api_json {
/**
 * Serialize preferences as the API returns them
 * {"user_id": 1, "language_filter": true, ..., "violence_sensitivity": "medium"}
 */
nlohmann::json toJson(int64_t user_id, const Preferences& preferences);

/**
 * Serialize a decision for POST /event
 * {"action", "duration_seconds", "matched_category" (string or null), "reason"}
 */
nlohmann::json toJson(const Decision& decision);

/**
 * Read a user id given either as a JSON integer or as a string of decimal digits
 *
 * @param value JSON value of the user_id field
 * @param out Parsed id (> 0)
 * @return false if the value is not a positive integer in either form
 */
bool parseUserId(const nlohmann::json& value, int64_t& out);

/**
 * Read a user id from a URL path segment (decimal digits only)
 */
bool parseUserId(const std::string& segment, int64_t& out);

/**
 * Read a partial preferences update
 *
 * Unknown keys are ignored. Filter flags must be booleans; sensitivities
 * must be "low", "medium" or "high".
 *
 * @param body JSON object from the request
 * @param out Parsed update
 * @param error Message for the client when parsing fails
 * @return true on success
 */
bool parsePreferencesUpdate(const nlohmann::json& body, PreferencesUpdate& out, std::string& error);
} // namespace api_json
