#ifndef HTTP_REQUEST_PARSER_HPP
#define HTTP_REQUEST_PARSER_HPP

#include <string>

/**
 * HTTPRequestParser - Handles reading and parsing HTTP requests from client sockets
 *
 * Responsibilities:
 * - Read complete HTTP request (headers + body if present)
 * - Split the request line into method, path and version
 * - Extract headers and body
 */
class HTTPRequestParser {
public:
    /**
     * Largest request (headers + body) accepted from a client
     */
    static constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;

    /**
     * Represents a parsed HTTP request
     */
    struct Request {
        std::string method;       // GET, POST, ...
        std::string target;       // Request target as sent (path + query)
        std::string path;         // Target without query string
        std::string version;      // HTTP/1.1
        std::string headers;      // Header block (including \r\n\r\n)
        std::string body;         // Body, possibly empty
        bool valid;               // Whether the request line parsed

        Request() : valid(false) {}
    };

    /**
     * Read a complete HTTP request from the client socket
     *
     * @param client_fd Socket file descriptor
     * @return Complete HTTP request as string (headers + body), or empty string on error
     */
    static std::string readRequest(int client_fd);

    /**
     * Parse a complete HTTP request
     *
     * @param request Raw request (headers + body)
     * @return Request object; valid is false if the request line is malformed
     */
    static Request parse(const std::string& request);

    /**
     * Extract the value of a specific header (case-insensitive)
     *
     * @param request HTTP request string
     * @param header_name Name of header to find (e.g., "Content-Length")
     * @return Header value, or empty string if not found
     */
    static std::string getHeader(const std::string& request, const std::string& header_name);

    /**
     * Check if request indicates connection should be kept alive
     *
     * @param request HTTP request string
     * @return true if connection should persist (HTTP/1.1 default), false otherwise
     */
    static bool shouldKeepAlive(const std::string& request);

private:
    /**
     * Helper: Append the next chunk received on fd to buffer
     *
     * @param fd Socket file descriptor
     * @param buffer Data received so far
     * @return false if the peer closed, the receive timed out or failed
     */
    static bool receiveMore(int fd, std::string& buffer);

    /**
     * Helper: Parse Content-Length from headers
     *
     * @param headers HTTP headers string
     * @return Content length, or 0 if absent or not a decimal number
     */
    static size_t parseContentLength(const std::string& headers);
};

#endif // HTTP_REQUEST_PARSER_HPP
