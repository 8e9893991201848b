#ifndef RESPONSE_BUILDER_HPP
#define RESPONSE_BUILDER_HPP

#include <string>

#include <nlohmann/json.hpp>

/**
 * ResponseBuilder - Generates complete HTTP responses with JSON bodies
 *
 * Responsibilities:
 * - Build status line and headers (Content-Type, Content-Length, Connection)
 * - Attach CORS headers to every response so browser, mobile and TV
 *   clients can call the API directly
 * - Build the {"error": "..."} body used by all error responses
 */
class ResponseBuilder {
public:
    /**
     * Build a response with a JSON body
     *
     * @param status HTTP status code
     * @param body JSON document to serialize
     * @param keep_alive Whether the connection stays open
     * @return Complete HTTP response (headers + body)
     */
    static std::string buildJson(int status, const nlohmann::json& body, bool keep_alive = true);

    /**
     * Build an error response: {"error": message}
     *
     * @param status HTTP status code (400, 404, ...)
     * @param message Human-readable error
     * @param keep_alive Whether the connection stays open
     * @return Complete HTTP response (headers + body)
     */
    static std::string buildError(int status, const std::string& message, bool keep_alive = true);

    /**
     * Build 204 No Content (CORS preflight answer)
     *
     * @param keep_alive Whether the connection stays open
     * @return Complete HTTP response
     */
    static std::string buildNoContent(bool keep_alive = true);

    /**
     * Reason phrase for a status code ("OK", "Not Found", ...)
     */
    static std::string statusText(int status);

private:
    /**
     * Build complete HTTP response from status and body
     *
     * @param status HTTP status code
     * @param body Body content (may be empty)
     * @param keep_alive Whether the connection stays open
     * @return Complete HTTP response
     */
    static std::string buildResponse(int status, const std::string& body, bool keep_alive);
};

#endif // RESPONSE_BUILDER_HPP
