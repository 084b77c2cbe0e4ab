#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "StatementClassifier.hpp"
#include "UriResolver.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace graphlink;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("graphlink", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::string credentialsLabel(const ResolvedUri& uri, const DriverConfig& config) {
    if (uri.hasCredentials()) {
        return "uri (" + *uri.user + ", tls required)";
    }
    if (config.hasCredentials()) {
        return "config (" + config.user + ", tls " + DriverConfig::tlsModeToString(config.tls_mode) + ")";
    }
    return "none";
}

// Returns false if the connection cannot be built from its URI
bool describeConnection(const ConnectionEntry& entry, bool master) {
    UriResolver resolver;
    try {
        auto resolved = resolver.resolve(entry.uri);
        std::cout << entry.alias << (master ? " (master)" : "") << "\n"
                  << "  uri:         " << entry.uri << "\n"
                  << "  protocol:    " << UriResolver::familyToString(resolved.family)
                  << " (" << resolved.scheme << ")\n"
                  << "  endpoint:    " << resolved.host << ":" << resolved.port << "\n"
                  << "  routing:     " << (resolved.routing ? "cluster routing table" : "direct") << "\n"
                  << "  credentials: " << credentialsLabel(resolved, entry.driver) << "\n";
        return true;
    } catch (const UnsupportedSchemeError& e) {
        spdlog::error("{}: {}", entry.alias, e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}: {}", entry.alias, e.what());
    }
    return false;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    if (config.connections.empty() && !config.statements.empty()) {
        spdlog::debug("No connection given, classifying statements only");
    } else if (!config.validate()) {
        return 1;
    }

    int status = 0;
    for (const auto& entry : config.connections) {
        if (!describeConnection(entry, entry.alias == config.master)) {
            status = 1;
        }
    }

    for (const auto& statement : config.statements) {
        auto mode = StatementClassifier::classify(statement);
        std::cout << StatementClassifier::modeToString(mode) << "\t" << statement << "\n";
    }

    std::cout.flush();
    return status;
}
