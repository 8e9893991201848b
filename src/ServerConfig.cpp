#include "ServerConfig.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

bool parseNumber(const std::string& text, int min, int max, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < min || value > max) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

bool ServerConfig::parse(int argc, char* argv[], ServerConfig& out, std::string& error) {
    ServerConfig config;

    // Environment first, the command line overrides it below
    if (const char* v = env("PORT")) {
        if (!parseNumber(v, 1, 65535, config.port)) {
            error = std::string("Invalid PORT: ") + v;
            return false;
        }
    }
    if (const char* v = env("ISWEEP_SIGNALS_FILE")) config.signals_file = v;
    if (const char* v = env("ISWEEP_ACTIONS_FILE")) config.actions_file = v;
    if (const char* v = env("ISWEEP_LOG_FILE")) config.log_file = v;
    if (const char* v = env("ISWEEP_LOOKUP_TIMEOUT_MS")) {
        if (!parseNumber(v, 0, 60000, config.lookup_timeout_ms)) {
            error = std::string("Invalid ISWEEP_LOOKUP_TIMEOUT_MS: ") + v;
            return false;
        }
    }

    int i = 1;

    // Mode
    if (i < argc && strcmp(argv[i], "serve") == 0) {
        ++i;
    } else if (i < argc && strcmp(argv[i], "check") == 0) {
        if (argc < 4) {
            error = "check needs a sensitivity and some text";
            return false;
        }
        if (!parseSensitivity(argv[2], config.check_sensitivity)) {
            error = std::string("Invalid sensitivity: ") + argv[2];
            return false;
        }
        config.mode = Mode::CHECK;
        for (int j = 3; j < argc; ++j) {
            if (j > 3) config.check_text += " ";
            config.check_text += argv[j];
        }
        out = config;
        return true;
    }

    // Options
    for (; i < argc; ++i) {
        std::string option = argv[i];
        if (i + 1 >= argc) {
            error = "Missing value for " + option;
            return false;
        }
        std::string value = argv[++i];

        if (option == "--port") {
            if (!parseNumber(value, 1, 65535, config.port)) {
                error = "Invalid port number: " + value;
                return false;
            }
        } else if (option == "--signals") {
            config.signals_file = value;
        } else if (option == "--actions") {
            config.actions_file = value;
        } else if (option == "--log-file") {
            config.log_file = value;
        } else if (option == "--lookup-timeout-ms") {
            if (!parseNumber(value, 0, 60000, config.lookup_timeout_ms)) {
                error = "Invalid lookup timeout: " + value;
                return false;
            }
        } else {
            error = "Unknown option: " + option;
            return false;
        }
    }

    out = config;
    return true;
}

void ServerConfig::printUsage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " [serve] [--port <n>] [--signals <file>] [--actions <file>]\n";
    std::cerr << "  " << std::string(std::strlen(program), ' ')
              << "         [--log-file <file>] [--lookup-timeout-ms <n>]\n";
    std::cerr << "  " << program << " check <low|medium|high> <text...>\n";
}
