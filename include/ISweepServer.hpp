#ifndef ISWEEP_SERVER_HPP
#define ISWEEP_SERVER_HPP

#include "BaseServer.hpp"
#include "DecisionEngine.hpp"
#include "HTTPRequestParser.hpp"
#include "Logger.hpp"
#include "UserStore.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

/**
 * ISweepServer - Multi-threaded HTTP/JSON front end for the decision engine
 *
 * Endpoints:
 * - GET  /api/health                   liveness
 * - POST /api/users                    create a user with default preferences
 * - GET  /api/users/<id>/preferences   read preferences
 * - PUT  /api/users/<id>/preferences   partial preferences update
 * - POST /api/analyze                  simple mode: {action, text, user_id}
 * - POST /event                        structured mode, always 200
 * - OPTIONS *                          CORS preflight
 *
 * This class orchestrates the request workflow by delegating to specialized components:
 * - HTTPRequestParser: Reads and parses incoming HTTP requests
 * - DecisionEngine: Produces playback decisions
 * - UserStore: Users and preferences
 * - ResponseBuilder: Serializes JSON responses with CORS headers
 */
class ISweepServer : public BaseServer {
public:
    static constexpr const char* SERVICE_NAME = "ISweep Backend";
    static constexpr const char* SERVICE_VERSION = "1.0.0";

    /**
     * Routed result before serialization
     */
    struct Response {
        int status;
        nlohmann::json body;
        bool no_content;

        Response() : status(200), no_content(false) {}
        Response(int s, nlohmann::json b) : status(s), body(std::move(b)), no_content(false) {}
    };

    /**
     * Constructor
     * @param port Port to listen on
     * @param store User and preferences store (also the engine's preferences source)
     * @param engine Decision engine
     */
    ISweepServer(int port, std::shared_ptr<UserStore> store,
                 std::shared_ptr<const DecisionEngine> engine);

    /**
     * Dispatch one parsed request to its endpoint
     *
     * Never throws: unexpected failures become 500, or an in-band
     * "none" decision for /event.
     *
     * @param request Parsed request
     * @return Status and JSON body
     */
    Response route(const HTTPRequestParser::Request& request);

protected:
    /**
     * Handle a client connection
     * This is called by BaseServer for each accepted connection
     *
     * @param client_fd Client socket file descriptor
     */
    void handleRequest(int client_fd) override;

private:
    std::shared_ptr<UserStore> store;
    std::shared_ptr<const DecisionEngine> engine;
    Logger logger;

    Response dispatch(const HTTPRequestParser::Request& request);

    Response handleHealth();
    Response handleCreateUser(const std::string& body);
    Response handleGetPreferences(int64_t user_id);
    Response handleUpdatePreferences(int64_t user_id, const std::string& body);
    Response handleAnalyze(const std::string& body);
    Response handleEvent(const std::string& body);

    static Response error(int status, const std::string& message);

    /**
     * Match "/api/users/<id>/preferences"
     * @return true and the id if the path has that shape with a numeric id
     */
    static bool matchPreferencesPath(const std::string& path, int64_t& user_id);
};

#endif // ISWEEP_SERVER_HPP
