#include "ISweepServer.hpp"
#include "ApiJson.hpp"
#include "NetworkUtils.hpp"
#include "ResponseBuilder.hpp"

#include <iostream>

namespace {

const std::string USERS_PREFIX = "/api/users/";
const std::string PREFERENCES_SUFFIX = "/preferences";

} // namespace

// ====================================================================================================
// Constructor
// ====================================================================================================
ISweepServer::ISweepServer(int port, std::shared_ptr<UserStore> store,
                           std::shared_ptr<const DecisionEngine> engine)
    : BaseServer(port), store(std::move(store)), engine(std::move(engine)), logger("api") {}

// ====================================================================================================
// Main Request Handler
// ====================================================================================================
void ISweepServer::handleRequest(int client_fd) {
    while (true) {
        // -------------------------------------------------------
        // STEP 1: Read and parse client request
        // -------------------------------------------------------
        std::string raw = HTTPRequestParser::readRequest(client_fd);
        if (raw.empty()) {
            return;  // Client disconnected, timed out or sent an oversized request
        }

        HTTPRequestParser::Request request = HTTPRequestParser::parse(raw);
        if (!request.valid) {
            std::cerr << "[ISweepServer] Malformed request line\n";
            NetworkUtils::sendData(client_fd, ResponseBuilder::buildError(400, "Malformed request", false));
            return;
        }

        logger.logRequest(raw);
        bool keep_alive = HTTPRequestParser::shouldKeepAlive(raw);

        // -------------------------------------------------------
        // STEP 2: Route to the endpoint
        // -------------------------------------------------------
        Response response = route(request);

        // -------------------------------------------------------
        // STEP 3: Serialize and send
        // -------------------------------------------------------
        std::string out = response.no_content
            ? ResponseBuilder::buildNoContent(keep_alive)
            : ResponseBuilder::buildJson(response.status, response.body, keep_alive);

        logger.logResponse(response.status, request.path);

        if (!NetworkUtils::sendData(client_fd, out)) {
            std::cerr << "[ISweepServer] Failed to send response to client\n";
            return;
        }

        // -------------------------------------------------------
        // STEP 4: Determine if connection should persist
        // -------------------------------------------------------
        if (!keep_alive) {
            return;
        }
    }
}

// ====================================================================================================
// Routing
// ====================================================================================================

ISweepServer::Response ISweepServer::route(const HTTPRequestParser::Request& request) {
    try {
        return dispatch(request);
    } catch (const std::exception& e) {
        logger.logError(request.method + " " + request.path + ": " + e.what());
        if (request.path == "/event") {
            return Response(200, api_json::toJson(Decision::noAction("Internal error")));
        }
        return error(500, "Internal server error");
    } catch (...) {
        logger.logError(request.method + " " + request.path + ": unknown exception");
        if (request.path == "/event") {
            return Response(200, api_json::toJson(Decision::noAction("Internal error")));
        }
        return error(500, "Internal server error");
    }
}

ISweepServer::Response ISweepServer::dispatch(const HTTPRequestParser::Request& request) {
    const std::string& method = request.method;
    const std::string& path = request.path;

    // CORS preflight for any path
    if (method == "OPTIONS") {
        Response preflight;
        preflight.status = 204;
        preflight.no_content = true;
        return preflight;
    }

    if (path == "/api/health") {
        return method == "GET" ? handleHealth() : error(405, "Method not allowed");
    }

    if (path == "/api/users") {
        return method == "POST" ? handleCreateUser(request.body) : error(405, "Method not allowed");
    }

    int64_t user_id = 0;
    if (matchPreferencesPath(path, user_id)) {
        if (method == "GET") {
            return handleGetPreferences(user_id);
        }
        if (method == "PUT") {
            return handleUpdatePreferences(user_id, request.body);
        }
        return error(405, "Method not allowed");
    }

    if (path == "/api/analyze") {
        return method == "POST" ? handleAnalyze(request.body) : error(405, "Method not allowed");
    }

    if (path == "/event") {
        return method == "POST" ? handleEvent(request.body) : error(405, "Method not allowed");
    }

    return error(404, "Endpoint not found");
}

bool ISweepServer::matchPreferencesPath(const std::string& path, int64_t& user_id) {
    if (path.size() <= USERS_PREFIX.size() + PREFERENCES_SUFFIX.size() ||
        path.compare(0, USERS_PREFIX.size(), USERS_PREFIX) != 0 ||
        path.compare(path.size() - PREFERENCES_SUFFIX.size(), PREFERENCES_SUFFIX.size(),
                     PREFERENCES_SUFFIX) != 0) {
        return false;
    }

    std::string segment = path.substr(USERS_PREFIX.size(),
                                      path.size() - USERS_PREFIX.size() - PREFERENCES_SUFFIX.size());
    return api_json::parseUserId(segment, user_id);
}

ISweepServer::Response ISweepServer::error(int status, const std::string& message) {
    return Response(status, nlohmann::json{{"error", message}});
}

// ====================================================================================================
// Endpoints
// ====================================================================================================

ISweepServer::Response ISweepServer::handleHealth() {
    return Response(200, nlohmann::json{
        {"status", "healthy"},
        {"service", SERVICE_NAME},
        {"version", SERVICE_VERSION},
    });
}

ISweepServer::Response ISweepServer::handleCreateUser(const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return error(400, "Username is required");
    }

    auto it = data.find("username");
    if (it == data.end() || !it->is_string() || it->get<std::string>().empty()) {
        return error(400, "Username is required");
    }

    std::string username = it->get<std::string>();
    auto user = store->createUser(username);
    if (!user) {
        return error(409, "Username already exists");
    }

    auto preferences = store->getPreferences(user->user_id);
    logger.logCustomMsg("Created user " + std::to_string(user->user_id) + " (" + username + ")");

    return Response(201, nlohmann::json{
        {"user_id", user->user_id},
        {"username", user->username},
        {"preferences", api_json::toJson(user->user_id, preferences.value_or(Preferences{}))},
    });
}

ISweepServer::Response ISweepServer::handleGetPreferences(int64_t user_id) {
    auto preferences = store->getPreferences(user_id);
    if (!preferences) {
        return error(404, "User not found");
    }
    return Response(200, api_json::toJson(user_id, *preferences));
}

ISweepServer::Response ISweepServer::handleUpdatePreferences(int64_t user_id, const std::string& body) {
    if (!store->getUser(user_id)) {
        return error(404, "User not found");
    }

    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return error(400, "Request body is required");
    }

    PreferencesUpdate update;
    std::string message;
    if (!api_json::parsePreferencesUpdate(data, update, message)) {
        return error(400, message);
    }

    auto preferences = store->updatePreferences(user_id, update);
    if (!preferences) {
        return error(404, "User not found");
    }

    return Response(200, nlohmann::json{
        {"message", "Preferences updated successfully"},
        {"preferences", api_json::toJson(user_id, *preferences)},
    });
}

ISweepServer::Response ISweepServer::handleAnalyze(const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object() ||
        !data.contains("user_id") || !data.contains("text")) {
        return error(400, "user_id and text are required");
    }

    int64_t user_id = 0;
    if (!api_json::parseUserId(data["user_id"], user_id)) {
        return error(400, "user_id must be a positive integer");
    }
    if (!data["text"].is_string()) {
        return error(400, "text must be a string");
    }

    std::string text = data["text"].get<std::string>();
    Action action = engine->analyze(user_id, text);
    logger.logCustomMsg("Analyze: user=" + std::to_string(user_id) +
                        " action=" + std::string(toString(action)));

    return Response(200, nlohmann::json{
        {"action", std::string(toString(action))},
        {"text", text},
        {"user_id", data["user_id"]},
    });
}

ISweepServer::Response ISweepServer::handleEvent(const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    Decision decision;
    std::string user_label = "-";
    std::optional<double> confidence_value;

    if (data.is_discarded() || !data.is_object()) {
        decision = DecisionEngine::invalidPayload("body must be a JSON object");
    } else if (!data.contains("user_id")) {
        decision = DecisionEngine::invalidPayload("user_id is required");
    } else if (!data.contains("text")) {
        decision = DecisionEngine::invalidPayload("text is required");
    } else {
        user_label = data["user_id"].dump();
        int64_t user_id = 0;
        nlohmann::json confidence = data.contains("confidence") ? data["confidence"] : nlohmann::json();

        if (!api_json::parseUserId(data["user_id"], user_id)) {
            decision = DecisionEngine::invalidPayload("user_id must be a positive integer");
        } else if (!data["text"].is_string()) {
            decision = DecisionEngine::invalidPayload("text must be a string");
        } else if (!confidence.is_null() && !confidence.is_number()) {
            decision = DecisionEngine::invalidPayload("confidence must be a number");
        } else {
            if (confidence.is_number()) {
                confidence_value = confidence.get<double>();
            }
            decision = engine->decide(user_id, data["text"].get<std::string>(), confidence_value);
        }
    }

    logger.logDecision(user_label, decision, confidence_value);
    return Response(200, api_json::toJson(decision));
}
