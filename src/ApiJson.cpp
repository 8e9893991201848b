#include "ApiJson.hpp"

#include <cctype>
#include <limits>

namespace api_json {

namespace {

const char* const SENSITIVITY_CHOICES = "low, medium, high";

bool readFlag(const nlohmann::json& body, const char* field,
              std::optional<bool>& out, std::string& error) {
    auto it = body.find(field);
    if (it == body.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = std::string("Invalid ") + field + ". Must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool readSensitivity(const nlohmann::json& body, const char* field,
                     std::optional<Sensitivity>& out, std::string& error) {
    auto it = body.find(field);
    if (it == body.end()) {
        return true;
    }
    Sensitivity value = Sensitivity::MEDIUM;
    if (!it->is_string() || !parseSensitivity(it->get<std::string>(), value)) {
        error = std::string("Invalid ") + field + ". Must be one of: " + SENSITIVITY_CHOICES;
        return false;
    }
    out = value;
    return true;
}

} // namespace

nlohmann::json toJson(int64_t user_id, const Preferences& preferences) {
    return nlohmann::json{
        {"user_id", user_id},
        {"language_filter", preferences.language_filter},
        {"sexual_content_filter", preferences.sexual_content_filter},
        {"violence_filter", preferences.violence_filter},
        {"language_sensitivity", std::string(toString(preferences.language_sensitivity))},
        {"sexual_content_sensitivity", std::string(toString(preferences.sexual_content_sensitivity))},
        {"violence_sensitivity", std::string(toString(preferences.violence_sensitivity))},
    };
}

nlohmann::json toJson(const Decision& decision) {
    nlohmann::json out;
    out["action"] = std::string(toString(decision.action));
    out["duration_seconds"] = decision.duration_seconds;
    if (decision.matched_category) {
        out["matched_category"] = std::string(toString(*decision.matched_category));
    } else {
        out["matched_category"] = nullptr;
    }
    out["reason"] = decision.reason;
    return out;
}

bool parseUserId(const nlohmann::json& value, int64_t& out) {
    if (value.is_number_unsigned()) {
        auto id = value.get<uint64_t>();
        if (id == 0 || id > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(id);
        return true;
    }
    if (value.is_number_integer()) {
        auto id = value.get<int64_t>();
        if (id <= 0) {
            return false;
        }
        out = id;
        return true;
    }
    if (value.is_string()) {
        return parseUserId(value.get<std::string>(), out);
    }
    return false;
}

bool parseUserId(const std::string& segment, int64_t& out) {
    // Up to 18 digits always fits in int64_t
    if (segment.empty() || segment.size() > 18) {
        return false;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    int64_t id = std::stoll(segment);
    if (id <= 0) {
        return false;
    }
    out = id;
    return true;
}

bool parsePreferencesUpdate(const nlohmann::json& body, PreferencesUpdate& out, std::string& error) {
    if (!body.is_object()) {
        error = "Request body is required";
        return false;
    }

    PreferencesUpdate update;
    bool ok = readFlag(body, "language_filter", update.language_filter, error) &&
              readFlag(body, "sexual_content_filter", update.sexual_content_filter, error) &&
              readFlag(body, "violence_filter", update.violence_filter, error) &&
              readSensitivity(body, "language_sensitivity", update.language_sensitivity, error) &&
              readSensitivity(body, "sexual_content_sensitivity", update.sexual_content_sensitivity, error) &&
              readSensitivity(body, "violence_sensitivity", update.violence_sensitivity, error);
    if (!ok) {
        return false;
    }

    if (update.empty()) {
        error = "No preference fields provided";
        return false;
    }

    out = update;
    return true;
}

} // namespace api_json
