#include <iostream>
#include <string>
#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <optional>

#include "Types.hpp"

class Logger {
    public:
        Logger(std::string clientID);
        ~Logger();
        static void configure(std::string logfile, bool echo); //Set shared log file path and console echo
        void logRequest(std::string request); //Log the request line and timestamp
        void logResponse(int status, std::string path); //Log the response status and timestamp
        void logDecision(const std::string& user_id, const Decision& decision,
                         std::optional<double> confidence = std::nullopt); //Log an engine decision
        void logConnectionOpened(std::string peer); //Log connection opening
        void logConnectionClosed(std::string peer); //Log connection closure
        void logCustomMsg(std::string entry); //Log custom message
        void logError(std::string entry); //Log an error (echoed to stderr)
    private:
        std::string clientID;
        const std::string getTime();
        void logToFile(std::string entry, std::ostream& console = std::cout);
};

#endif // LOGGER_HPP
