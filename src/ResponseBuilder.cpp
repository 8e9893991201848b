#include "ResponseBuilder.hpp"
#include <sstream>

// ====================================================================================================
// Public Methods
// ====================================================================================================

std::string ResponseBuilder::buildJson(int status, const nlohmann::json& body, bool keep_alive) {
    // Invalid UTF-8 in echoed input is replaced rather than thrown
    return buildResponse(status, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                         keep_alive);
}

std::string ResponseBuilder::buildError(int status, const std::string& message, bool keep_alive) {
    return buildJson(status, nlohmann::json{{"error", message}}, keep_alive);
}

std::string ResponseBuilder::buildNoContent(bool keep_alive) {
    return buildResponse(204, "", keep_alive);
}

std::string ResponseBuilder::statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::string ResponseBuilder::buildResponse(int status, const std::string& body, bool keep_alive) {
    std::ostringstream response;

    response << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
    if (status != 204) {
        response << "Content-Type: application/json\r\n"
                 << "Content-Length: " << body.size() << "\r\n";
    }
    response << "Access-Control-Allow-Origin: *\r\n"
             << "Access-Control-Allow-Methods: GET, POST, PUT, OPTIONS\r\n"
             << "Access-Control-Allow-Headers: Content-Type\r\n"
             << "Cache-Control: no-store\r\n"
             << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n"
             << "\r\n"
             << body;

    return response.str();
}
