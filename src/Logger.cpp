#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;

// Shared settings, written once at startup by Logger::configure
static std::string g_log_file = "logs/isweep.log";
static bool g_echo = true;

// Sanitize a log line (trim CRLF, keep printable ASCII/whitespace, cap length)
static std::string sanitize_line(std::string s) {
    // Trim at first CRLF
    if (auto p = s.find("\r\n"); p != std::string::npos)
        s.erase(p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        // drop other control/binary
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given client or component
Logger::Logger(std::string clientID){
    this->clientID = clientID;
}

Logger::~Logger(){
}

void Logger::configure(std::string logfile, bool echo){
    std::lock_guard<std::mutex> lock(g_log_file_mutex);
    g_log_file = logfile;
    g_echo = echo;

    // Ensure the log directory exists (safe if it already exists)
    std::filesystem::path dir = std::filesystem::path(g_log_file).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[Logger] ERROR: cannot create " << dir << ": " << ec.message() << "\n";
        }
    }
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                       std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

void Logger::logRequest(std::string request){
    //Sanitize the request line before logging
    const std::string clean = sanitize_line(request);
    logToFile(fmt::format("{} [{}]: Request: {}", getTime(), clientID, clean));
}

void Logger::logResponse(int status, std::string path){
    logToFile(fmt::format("{} [{}]: Response: {} for {}", getTime(), clientID, status,
                          sanitize_line(path)));
}

void Logger::logDecision(const std::string& user_id, const Decision& decision,
                         std::optional<double> confidence){
    std::string entry = fmt::format("{} [{}]: Decision: user={} action={} duration={} category={} reason=\"{}\"",
                                    getTime(), clientID, sanitize_line(user_id), toString(decision.action),
                                    decision.duration_seconds,
                                    decision.matched_category ? toString(*decision.matched_category) : "null",
                                    decision.reason);
    if (confidence) {
        entry += fmt::format(" confidence={:.2f}", *confidence);
    }
    logToFile(entry);
}

void Logger::logConnectionOpened(std::string peer){
    logToFile(fmt::format("{} [{}]: Connection opened from {}", getTime(), clientID, peer));
}

void Logger::logConnectionClosed(std::string peer){
    logToFile(fmt::format("{} [{}]: Connection closed for {}", getTime(), clientID, peer));
}

void Logger::logCustomMsg(std::string entry){
    logToFile(fmt::format("{} [{}]: {}", getTime(), clientID, entry));
}

void Logger::logError(std::string entry){
    logToFile(fmt::format("{} [{}]: ERROR: {}", getTime(), clientID, entry), std::cerr);
}


void Logger::logToFile(std::string entry, std::ostream& console){
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    if (g_echo) {
        console << entry << std::endl;
    }

    std::ofstream out(g_log_file, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << g_log_file << "\n";
        return;
    }
    out << entry << '\n';
}
