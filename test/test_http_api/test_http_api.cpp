/*
 * File: test/test_http_api/test_http_api.cpp
 * Description: HTTP surface without sockets.
 * Raw requests go through HTTPRequestParser and ISweepServer::route;
 * responses are checked for status and JSON body.
 */
#include <unity.h>
#include "ISweepServer.hpp"
#include "ResponseBuilder.hpp"
#include "MockPreferencesStore.h"

#include <memory>
#include <string>

// --- Helpers ---

static std::shared_ptr<UserStore> store;
static std::unique_ptr<ISweepServer> server;

static std::string raw(const std::string& method, const std::string& target, const std::string& body = "") {
    std::string out = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!body.empty()) {
        out += "Content-Type: application/json\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    return out + "\r\n" + body;
}

static ISweepServer::Response call(const std::string& method, const std::string& target,
                                   const std::string& body = "") {
    HTTPRequestParser::Request request = HTTPRequestParser::parse(raw(method, target, body));
    TEST_ASSERT_TRUE(request.valid);
    return server->route(request);
}

// User store whose preference reads fail with a non-std error type
class UnreachableUserStore : public UserStore {
public:
    std::optional<Preferences> getPreferences(int64_t) const override {
        throw BackendDown{};
    }
};

static void useUnreachableStore() {
    auto unreachable = std::make_shared<UnreachableUserStore>();
    auto engine = std::make_shared<const DecisionEngine>(unreachable);
    store = unreachable;
    server = std::make_unique<ISweepServer>(0, store, engine);
}

static std::string str(const nlohmann::json& body, const char* key) {
    return body.at(key).get<std::string>();
}

// --- Setup ---
void setUp(void) {
    store = std::make_shared<UserStore>();
    auto engine = std::make_shared<const DecisionEngine>(store);
    server = std::make_unique<ISweepServer>(0, store, engine);
}
void tearDown(void) {
    server.reset();
    store.reset();
}

// --- Tests: Parser ---

void test_parser_splits_request_line_and_body(void) {
    auto request = HTTPRequestParser::parse(raw("POST", "/event?debug=1", "{\"a\":1}"));

    TEST_ASSERT_TRUE(request.valid);
    TEST_ASSERT_EQUAL_STRING("POST", request.method.c_str());
    TEST_ASSERT_EQUAL_STRING("/event", request.path.c_str());
    TEST_ASSERT_EQUAL_STRING("/event?debug=1", request.target.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"a\":1}", request.body.c_str());
    TEST_ASSERT_EQUAL_STRING("7", HTTPRequestParser::getHeader(request.headers, "content-length").c_str());
}

void test_parser_rejects_bad_request_line(void) {
    TEST_ASSERT_FALSE(HTTPRequestParser::parse("GARBAGE\r\n\r\n").valid);
    TEST_ASSERT_FALSE(HTTPRequestParser::parse("GET / FTP/1.0\r\n\r\n").valid);
    TEST_ASSERT_FALSE(HTTPRequestParser::parse("GET /api/health HTTP/1.1\r\n").valid);
}

void test_keep_alive_rules(void) {
    TEST_ASSERT_TRUE(HTTPRequestParser::shouldKeepAlive("GET / HTTP/1.1\r\n\r\n"));
    TEST_ASSERT_FALSE(HTTPRequestParser::shouldKeepAlive("GET / HTTP/1.1\r\nConnection: close\r\n\r\n"));
    TEST_ASSERT_FALSE(HTTPRequestParser::shouldKeepAlive("GET / HTTP/1.0\r\n\r\n"));
}

// --- Tests: Endpoints ---

void test_health(void) {
    auto r = call("GET", "/api/health");

    TEST_ASSERT_EQUAL_INT(200, r.status);
    TEST_ASSERT_EQUAL_STRING("healthy", str(r.body, "status").c_str());
    TEST_ASSERT_EQUAL_STRING("ISweep Backend", str(r.body, "service").c_str());
    TEST_ASSERT_EQUAL_STRING("1.0.0", str(r.body, "version").c_str());
}

void test_create_user_and_read_preferences(void) {
    auto created = call("POST", "/api/users", "{\"username\": \"alice\"}");
    TEST_ASSERT_EQUAL_INT(201, created.status);
    TEST_ASSERT_EQUAL_INT64(1, created.body.at("user_id").get<int64_t>());
    TEST_ASSERT_EQUAL_STRING("alice", str(created.body, "username").c_str());
    TEST_ASSERT_TRUE(created.body.at("preferences").at("language_filter").get<bool>());

    auto prefs = call("GET", "/api/users/1/preferences");
    TEST_ASSERT_EQUAL_INT(200, prefs.status);
    TEST_ASSERT_EQUAL_STRING("medium", str(prefs.body, "violence_sensitivity").c_str());
    TEST_ASSERT_EQUAL_INT64(1, prefs.body.at("user_id").get<int64_t>());
}

void test_create_user_errors(void) {
    TEST_ASSERT_EQUAL_INT(400, call("POST", "/api/users", "{}").status);
    TEST_ASSERT_EQUAL_INT(400, call("POST", "/api/users", "not json").status);
    TEST_ASSERT_EQUAL_INT(400, call("POST", "/api/users", "{\"username\": \"\"}").status);

    TEST_ASSERT_EQUAL_INT(201, call("POST", "/api/users", "{\"username\": \"bob\"}").status);
    auto dup = call("POST", "/api/users", "{\"username\": \"bob\"}");
    TEST_ASSERT_EQUAL_INT(409, dup.status);
    TEST_ASSERT_EQUAL_STRING("Username already exists", str(dup.body, "error").c_str());
}

void test_update_preferences(void) {
    call("POST", "/api/users", "{\"username\": \"carol\"}");

    auto r = call("PUT", "/api/users/1/preferences",
                  "{\"language_filter\": false, \"violence_sensitivity\": \"low\"}");
    TEST_ASSERT_EQUAL_INT(200, r.status);
    TEST_ASSERT_EQUAL_STRING("Preferences updated successfully", str(r.body, "message").c_str());
    TEST_ASSERT_FALSE(r.body.at("preferences").at("language_filter").get<bool>());
    TEST_ASSERT_EQUAL_STRING("low", r.body.at("preferences").at("violence_sensitivity").get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("medium", r.body.at("preferences").at("sexual_content_sensitivity").get<std::string>().c_str());
}

void test_update_preferences_errors(void) {
    call("POST", "/api/users", "{\"username\": \"dave\"}");

    auto bad_level = call("PUT", "/api/users/1/preferences", "{\"language_sensitivity\": \"extreme\"}");
    TEST_ASSERT_EQUAL_INT(400, bad_level.status);
    TEST_ASSERT_EQUAL_STRING("Invalid language_sensitivity. Must be one of: low, medium, high",
                             str(bad_level.body, "error").c_str());

    auto bad_flag = call("PUT", "/api/users/1/preferences", "{\"violence_filter\": \"yes\"}");
    TEST_ASSERT_EQUAL_INT(400, bad_flag.status);
    TEST_ASSERT_EQUAL_STRING("Invalid violence_filter. Must be a boolean", str(bad_flag.body, "error").c_str());

    auto empty = call("PUT", "/api/users/1/preferences", "{\"unrelated\": 1}");
    TEST_ASSERT_EQUAL_INT(400, empty.status);
    TEST_ASSERT_EQUAL_STRING("No preference fields provided", str(empty.body, "error").c_str());

    auto missing = call("PUT", "/api/users/9/preferences", "{\"violence_filter\": false}");
    TEST_ASSERT_EQUAL_INT(404, missing.status);
    TEST_ASSERT_EQUAL_STRING("User not found", str(missing.body, "error").c_str());

    // Rejected updates change nothing
    auto prefs = call("GET", "/api/users/1/preferences");
    TEST_ASSERT_EQUAL_STRING("medium", str(prefs.body, "language_sensitivity").c_str());
    TEST_ASSERT_TRUE(prefs.body.at("violence_filter").get<bool>());
}

void test_analyze(void) {
    call("POST", "/api/users", "{\"username\": \"erin\"}");

    auto r = call("POST", "/api/analyze", "{\"user_id\": 1, \"text\": \"this is a damn good scene\"}");
    TEST_ASSERT_EQUAL_INT(200, r.status);
    TEST_ASSERT_EQUAL_STRING("mute", str(r.body, "action").c_str());
    TEST_ASSERT_EQUAL_STRING("this is a damn good scene", str(r.body, "text").c_str());
    TEST_ASSERT_EQUAL_INT64(1, r.body.at("user_id").get<int64_t>());

    auto unknown = call("POST", "/api/analyze", "{\"user_id\": 9999999, \"text\": \"damn\"}");
    TEST_ASSERT_EQUAL_INT(200, unknown.status);
    TEST_ASSERT_EQUAL_STRING("none", str(unknown.body, "action").c_str());
}

void test_analyze_errors(void) {
    auto missing = call("POST", "/api/analyze", "{\"text\": \"damn\"}");
    TEST_ASSERT_EQUAL_INT(400, missing.status);
    TEST_ASSERT_EQUAL_STRING("user_id and text are required", str(missing.body, "error").c_str());

    auto bad_id = call("POST", "/api/analyze", "{\"user_id\": -3, \"text\": \"damn\"}");
    TEST_ASSERT_EQUAL_INT(400, bad_id.status);
    TEST_ASSERT_EQUAL_STRING("user_id must be a positive integer", str(bad_id.body, "error").c_str());

    auto bad_text = call("POST", "/api/analyze", "{\"user_id\": 1, \"text\": 5}");
    TEST_ASSERT_EQUAL_INT(400, bad_text.status);
    TEST_ASSERT_EQUAL_STRING("text must be a string", str(bad_text.body, "error").c_str());
}

void test_event_decision(void) {
    call("POST", "/api/users", "{\"username\": \"frank\"}");

    auto r = call("POST", "/event", "{\"user_id\": \"1\", \"text\": \"this is a damn good scene\", \"confidence\": 0.8}");
    TEST_ASSERT_EQUAL_INT(200, r.status);
    TEST_ASSERT_EQUAL_STRING("mute", str(r.body, "action").c_str());
    TEST_ASSERT_EQUAL_INT(4, r.body.at("duration_seconds").get<int>());
    TEST_ASSERT_EQUAL_STRING("language", str(r.body, "matched_category").c_str());
    TEST_ASSERT_EQUAL_STRING("language content detected; sensitivity=medium; severity=1",
                             str(r.body, "reason").c_str());
}

void test_event_unknown_user(void) {
    auto r = call("POST", "/event", "{\"user_id\": 9999999, \"text\": \"damn\"}");

    TEST_ASSERT_EQUAL_INT(200, r.status);
    TEST_ASSERT_EQUAL_STRING("none", str(r.body, "action").c_str());
    TEST_ASSERT_EQUAL_INT(0, r.body.at("duration_seconds").get<int>());
    TEST_ASSERT_TRUE(r.body.at("matched_category").is_null());
    TEST_ASSERT_EQUAL_STRING("Unknown user", str(r.body, "reason").c_str());
}

void test_event_invalid_payloads_answer_in_band(void) {
    struct Case { const char* body; const char* reason; };
    const Case cases[] = {
        {"[1, 2]", "Invalid payload: body must be a JSON object"},
        {"{\"text\": \"damn\"}", "Invalid payload: user_id is required"},
        {"{\"user_id\": 1}", "Invalid payload: text is required"},
        {"{\"user_id\": \"abc\", \"text\": \"damn\"}", "Invalid payload: user_id must be a positive integer"},
        {"{\"user_id\": 1, \"text\": [\"damn\"]}", "Invalid payload: text must be a string"},
        {"{\"user_id\": 1, \"text\": \"damn\", \"confidence\": \"high\"}", "Invalid payload: confidence must be a number"},
        {"{\"user_id\": 1, \"text\": \"damn\", \"confidence\": 2}", "Invalid payload: confidence must be between 0 and 1"},
    };

    call("POST", "/api/users", "{\"username\": \"gina\"}");
    for (const Case& c : cases) {
        auto r = call("POST", "/event", c.body);
        TEST_ASSERT_EQUAL_INT(200, r.status);
        TEST_ASSERT_EQUAL_STRING("none", str(r.body, "action").c_str());
        TEST_ASSERT_TRUE(r.body.at("matched_category").is_null());
        TEST_ASSERT_EQUAL_STRING(c.reason, str(r.body, "reason").c_str());
    }
}

void test_foreign_exceptions_do_not_escape_route(void) {
    useUnreachableStore();

    auto created = call("POST", "/api/users", "{\"username\": \"ivy\"}");
    TEST_ASSERT_EQUAL_INT(500, created.status);
    TEST_ASSERT_EQUAL_STRING("Internal server error", str(created.body, "error").c_str());

    auto prefs = call("GET", "/api/users/1/preferences");
    TEST_ASSERT_EQUAL_INT(500, prefs.status);

    auto event = call("POST", "/event", "{\"user_id\": 1, \"text\": \"damn\"}");
    TEST_ASSERT_EQUAL_INT(200, event.status);
    TEST_ASSERT_EQUAL_STRING("none", str(event.body, "action").c_str());
    TEST_ASSERT_EQUAL_STRING("Preferences unavailable", str(event.body, "reason").c_str());

    auto analyzed = call("POST", "/api/analyze", "{\"user_id\": 1, \"text\": \"damn\"}");
    TEST_ASSERT_EQUAL_INT(200, analyzed.status);
    TEST_ASSERT_EQUAL_STRING("none", str(analyzed.body, "action").c_str());
}

void test_routing_errors_and_preflight(void) {
    auto missing = call("GET", "/api/unknown");
    TEST_ASSERT_EQUAL_INT(404, missing.status);
    TEST_ASSERT_EQUAL_STRING("Endpoint not found", str(missing.body, "error").c_str());

    TEST_ASSERT_EQUAL_INT(404, call("GET", "/api/users/abc/preferences").status);
    TEST_ASSERT_EQUAL_INT(405, call("DELETE", "/api/health").status);
    TEST_ASSERT_EQUAL_INT(405, call("GET", "/event").status);

    auto preflight = call("OPTIONS", "/event");
    TEST_ASSERT_EQUAL_INT(204, preflight.status);
    TEST_ASSERT_TRUE(preflight.no_content);
}

void test_response_carries_cors_headers(void) {
    std::string json = ResponseBuilder::buildJson(200, nlohmann::json{{"ok", true}}, true);
    TEST_ASSERT_TRUE(json.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    TEST_ASSERT_TRUE(json.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos);
    TEST_ASSERT_TRUE(json.find("Content-Type: application/json\r\n") != std::string::npos);
    TEST_ASSERT_TRUE(json.find("Connection: keep-alive\r\n") != std::string::npos);

    std::string empty = ResponseBuilder::buildNoContent(false);
    TEST_ASSERT_TRUE(empty.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0);
    TEST_ASSERT_TRUE(empty.find("Content-Length") == std::string::npos);
    TEST_ASSERT_TRUE(empty.find("Connection: close\r\n") != std::string::npos);
}

// --- Runner ---
int main(void) {
    Logger::configure("test_logs/test_http_api.log", false);

    UNITY_BEGIN();
    RUN_TEST(test_parser_splits_request_line_and_body);
    RUN_TEST(test_parser_rejects_bad_request_line);
    RUN_TEST(test_keep_alive_rules);

    RUN_TEST(test_health);
    RUN_TEST(test_create_user_and_read_preferences);
    RUN_TEST(test_create_user_errors);
    RUN_TEST(test_update_preferences);
    RUN_TEST(test_update_preferences_errors);
    RUN_TEST(test_analyze);
    RUN_TEST(test_analyze_errors);
    RUN_TEST(test_event_decision);
    RUN_TEST(test_event_unknown_user);
    RUN_TEST(test_event_invalid_payloads_answer_in_band);
    RUN_TEST(test_foreign_exceptions_do_not_escape_route);
    RUN_TEST(test_routing_errors_and_preflight);
    RUN_TEST(test_response_carries_cors_headers);
    return UNITY_END();
}
