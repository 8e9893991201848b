#include "HTTPRequestParser.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <charconv>
#include <sstream>
#include <iostream>
#include "StringUtils.hpp"

using namespace utils;

// ============================================================================
// Public Methods
// ============================================================================

std::string HTTPRequestParser::readRequest(int client_fd) {
    std::string raw;

    // -------------------------------------------------------
    // Header block
    // -------------------------------------------------------
    size_t header_end = std::string::npos;
    while ((header_end = raw.find("\r\n\r\n")) == std::string::npos) {
        if (raw.size() > MAX_REQUEST_SIZE) {
            std::cerr << "[HTTPRequestParser] Request headers too large\n";
            return "";
        }
        if (!receiveMore(client_fd, raw)) {
            return "";  // Closed, timed out or failed
        }
    }

    // -------------------------------------------------------
    // Body, sized by Content-Length
    // -------------------------------------------------------
    size_t content_length = parseContentLength(raw.substr(0, header_end + 4));
    if (content_length > MAX_REQUEST_SIZE) {
        std::cerr << "[HTTPRequestParser] Request body too large (" << content_length << " bytes)\n";
        return "";
    }

    size_t total = header_end + 4 + content_length;
    while (raw.size() < total) {
        if (!receiveMore(client_fd, raw)) {
            std::cerr << "[HTTPRequestParser] Incomplete request body\n";
            return "";
        }
    }

    raw.resize(total);
    return raw;
}

HTTPRequestParser::Request HTTPRequestParser::parse(const std::string& request) {
    Request req;

    size_t line_end = request.find("\r\n");
    size_t header_end = request.find("\r\n\r\n");
    if (line_end == std::string::npos || header_end == std::string::npos) {
        return req;
    }

    // Request line: METHOD SP target SP version
    std::istringstream stream(request.substr(0, line_end));
    std::string extra;
    stream >> req.method >> req.target >> req.version;
    if (req.method.empty() || req.target.empty() ||
        req.version.rfind("HTTP/", 0) != 0 || (stream >> extra)) {
        return req;
    }

    size_t query = req.target.find('?');
    req.path = req.target.substr(0, query);

    req.headers = request.substr(0, header_end + 4);
    req.body = request.substr(header_end + 4);

    // Drop anything past Content-Length (pipelined data is not supported)
    size_t content_length = parseContentLength(req.headers);
    if (req.body.size() > content_length) {
        req.body.resize(content_length);
    }

    req.valid = true;
    return req;
}

std::string HTTPRequestParser::getHeader(const std::string& request,
                                          const std::string& header_name) {
    // Only search the header block
    size_t header_end = request.find("\r\n\r\n");
    std::string header_block = request.substr(0, header_end == std::string::npos
                                                     ? request.size() : header_end + 2);

    // Create lowercase versions for case-insensitive search
    std::string lower_request = toLower(header_block);
    std::string search_key = "\r\n" + toLower(header_name) + ":";

    size_t pos = lower_request.find(search_key);
    if (pos == std::string::npos) {
        return "";
    }

    // Move past the line break, header name and colon
    pos += search_key.length();

    // Skip whitespace
    while (pos < header_block.size() && (header_block[pos] == ' ' || header_block[pos] == '\t')) {
        pos++;
    }

    // Find end of line
    size_t end = header_block.find("\r\n", pos);
    if (end == std::string::npos) {
        return "";
    }

    // Value keeps its original case
    return trim(header_block.substr(pos, end - pos));
}

bool HTTPRequestParser::shouldKeepAlive(const std::string& request) {
    // Check HTTP version on the request line
    std::string request_line = request.substr(0, request.find("\r\n"));
    bool is_http_1_0 = (request_line.find("HTTP/1.0") != std::string::npos);

    // Get Connection header
    std::string lower_conn = toLower(getHeader(request, "Connection"));

    // HTTP/1.0: Keep-alive only if explicitly requested
    if (is_http_1_0) {
        return (lower_conn == "keep-alive");
    }

    // HTTP/1.1: Keep-alive by default unless "close" specified
    return (lower_conn != "close");
}

// ============================================================================
// Private Helper Methods
// ============================================================================

bool HTTPRequestParser::receiveMore(int fd, std::string& buffer) {
    char chunk[8192];

    while (true) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

size_t HTTPRequestParser::parseContentLength(const std::string& headers) {
    std::string value = getHeader(headers, "Content-Length");

    size_t length = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || end != value.data() + value.size()) {
        return 0;  // Absent or not a plain decimal number
    }
    return length;
}
