#include <iostream>
#include <memory>
#include <csignal>

#include "ApiJson.hpp"
#include "DecisionEngine.hpp"
#include "ISweepServer.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "UserStore.hpp"


int main(int argc, char* argv[]) {
    // Basic Argument Parsing
    ServerConfig config;
    std::string error;
    if (!ServerConfig::parse(argc, argv, config, error)) {
        std::cerr << error << "\n";
        ServerConfig::printUsage(argv[0]);
        return 1;
    }

    // A client vanishing mid-response must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    Logger::configure(config.log_file, config.mode == ServerConfig::Mode::SERVE);

    // Load Signal Sets and Action Rules
    CategoryMatcher matcher;
    if (!config.signals_file.empty() && !matcher.loadFromFile(config.signals_file)) {
        std::cerr << "Failed to load signals from " << config.signals_file << "\n";
        return 1;
    }

    SensitivityEvaluator evaluator;
    if (!config.actions_file.empty() && !evaluator.loadFromFile(config.actions_file)) {
        std::cerr << "Failed to load action rules from " << config.actions_file << "\n";
        return 1;
    }

    auto store = std::make_shared<UserStore>();
    auto engine = std::make_shared<const DecisionEngine>(
        store, std::move(matcher), std::move(evaluator),
        std::chrono::milliseconds(config.lookup_timeout_ms));

    // Check Mode: one offline decision, printed as JSON
    if (config.mode == ServerConfig::Mode::CHECK) {
        Preferences preferences;
        preferences.language_sensitivity = config.check_sensitivity;
        preferences.sexual_content_sensitivity = config.check_sensitivity;
        preferences.violence_sensitivity = config.check_sensitivity;

        try {
            Decision decision = engine->evaluate(preferences, config.check_text);
            std::cout << api_json::toJson(decision).dump(2) << "\n";
        } catch (const InvalidConfiguration& e) {
            std::cerr << "Invalid configuration: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    // Server Mode
    ISweepServer server(config.port, store, engine);
    if (!server.start()) {
        return 1;
    }

    return 0;
}
