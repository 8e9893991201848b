#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <string>

#include "Types.hpp"

/**
 * ServerConfig - Startup settings from the command line and environment
 *
 * Command line options win over environment variables:
 *   --port               PORT                      (default 5000)
 *   --signals            ISWEEP_SIGNALS_FILE       (default: built-in signal sets)
 *   --actions            ISWEEP_ACTIONS_FILE       (default: built-in action rules)
 *   --log-file           ISWEEP_LOG_FILE           (default logs/isweep.log)
 *   --lookup-timeout-ms  ISWEEP_LOOKUP_TIMEOUT_MS  (default 500, 0 = unbounded)
 */
struct ServerConfig {
    enum class Mode {
        SERVE,
        CHECK
    };

    Mode mode = Mode::SERVE;
    int port = 5000;
    std::string signals_file;
    std::string actions_file;
    std::string log_file = "logs/isweep.log";
    int lookup_timeout_ms = 500;

    // check mode: one offline decision with every filter on at this sensitivity
    Sensitivity check_sensitivity = Sensitivity::MEDIUM;
    std::string check_text;

    /**
     * Parse argv, falling back to environment variables
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @param out Parsed configuration
     * @param error Message for the user when parsing fails
     * @return true on success
     */
    static bool parse(int argc, char* argv[], ServerConfig& out, std::string& error);

    static void printUsage(const char* program);
};

#endif // SERVER_CONFIG_HPP
