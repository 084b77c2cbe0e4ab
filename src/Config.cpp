#include "Config.hpp"
#include "UriResolver.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace graphlink {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseBool(const std::string& value) {
    auto lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes";
}

ConnectionEntry& entryFor(Config& config, const std::string& alias) {
    for (auto& entry : config.connections) {
        if (entry.alias == alias) {
            return entry;
        }
    }
    config.connections.push_back(ConnectionEntry{alias, "", DriverConfig{}});
    return config.connections.back();
}

}  // namespace

DriverConfig DriverConfig::withCredentials(const std::string& user, const std::string& password) const {
    DriverConfig copy = *this;
    copy.user = user;
    copy.password = password;
    return copy;
}

DriverConfig DriverConfig::withTlsMode(TlsMode mode) const {
    DriverConfig copy = *this;
    copy.tls_mode = mode;
    return copy;
}

std::optional<TlsMode> DriverConfig::parseTlsMode(const std::string& value) {
    auto lower = toLower(trim(value));
    if (lower == "disabled" || lower == "off" || lower == "false") return TlsMode::Disabled;
    if (lower == "optional") return TlsMode::Optional;
    if (lower == "required" || lower == "on" || lower == "true") return TlsMode::Required;
    return std::nullopt;
}

std::string DriverConfig::tlsModeToString(TlsMode mode) {
    switch (mode) {
        case TlsMode::Disabled: return "disabled";
        case TlsMode::Optional: return "optional";
        case TlsMode::Required: return "required";
    }
    return "unknown";
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    static const std::string kConnectionPrefix = "connection.";

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "client") {
                if (key == "master") config.master = value;
                else if (key == "debug") config.debug = parseBool(value);
                else if (key == "log_file") config.log_file = value;
            }
            else if (current_section.compare(0, kConnectionPrefix.size(), kConnectionPrefix) == 0) {
                auto alias = current_section.substr(kConnectionPrefix.size());
                if (alias.empty()) {
                    spdlog::warn("Ignoring connection section without alias in {}", path.string());
                    continue;
                }
                auto& entry = entryFor(config, alias);

                if (key == "uri") entry.uri = value;
                else if (key == "user") entry.driver.user = value;
                else if (key == "password") entry.driver.password = value;
                else if (key == "user_agent") entry.driver.user_agent = value;
                else if (key == "tls") {
                    auto mode = DriverConfig::parseTlsMode(value);
                    if (mode) {
                        entry.driver.tls_mode = *mode;
                    } else {
                        spdlog::warn("Unknown tls mode '{}' for connection {}", value, alias);
                    }
                }
                else if (key == "connect_timeout")
                    entry.driver.connect_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "socket_timeout")
                    entry.driver.socket_timeout = std::chrono::milliseconds(std::stoi(value));
                else
                    entry.driver.options[key] = value;
            }
        } catch (const std::logic_error& e) {
            spdlog::warn("Invalid value '{}' for {} in [{}]: {}", value, key, current_section, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"graphlink - inspect graph database connection routing"};

    std::vector<std::string> uris;
    app.add_option("-U,--uri", uris,
                   "Connection URI, may be given several times (alias = default, conn1, ...)");

    std::string user;
    std::string password;
    app.add_option("-u,--user", user, "Username applied to every connection");
    app.add_option("-p,--password", password, "Password (or use GRAPHLINK_PASSWORD env)");

    std::string tls;
    app.add_option("--tls", tls, "TLS mode: disabled, optional, required");

    app.add_option("-s,--statement", config.statements,
                   "Cypher statement to classify, may be given several times");

    app.add_option("-m,--master", config.master, "Alias of the master connection");

    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("-l,--log-file", config.log_file, "Also write logs to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            // Command line args override file config
            config.connections = file_config->connections;
            if (config.master.empty()) {
                config.master = file_config->master;
            }
            if (config.log_file.empty()) {
                config.log_file = file_config->log_file;
            }
            config.debug = config.debug || file_config->debug;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Apply parsed values
    for (size_t i = 0; i < uris.size(); ++i) {
        ConnectionEntry entry;
        entry.alias = (i == 0 && config.findConnection("default") == nullptr)
                          ? "default"
                          : "conn" + std::to_string(i);
        entry.uri = uris[i];
        config.connections.push_back(entry);
    }

    for (auto& entry : config.connections) {
        if (!user.empty()) entry.driver.user = user;
        if (!password.empty()) entry.driver.password = password;
        if (!tls.empty()) {
            auto mode = DriverConfig::parseTlsMode(tls);
            if (mode) {
                entry.driver.tls_mode = *mode;
            } else {
                spdlog::warn("Unknown tls mode '{}', keeping {}", tls,
                             DriverConfig::tlsModeToString(entry.driver.tls_mode));
            }
        }
    }

    if (config.master.empty() && !config.connections.empty()) {
        config.master = config.connections.front().alias;
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (connections.empty()) {
        spdlog::error("At least one connection is required (use -U or -c)");
        return false;
    }

    std::set<std::string> seen;
    for (const auto& entry : connections) {
        if (!seen.insert(entry.alias).second) {
            spdlog::error("Duplicate connection alias: {}", entry.alias);
            return false;
        }
        if (entry.uri.empty()) {
            spdlog::error("Connection {} has no uri", entry.alias);
            return false;
        }
        auto scheme_end = entry.uri.find("://");
        if (scheme_end == std::string::npos ||
            !UriResolver::schemeFamily(entry.uri.substr(0, scheme_end))) {
            spdlog::error("Connection {} uses an unsupported scheme: {}", entry.alias, entry.uri);
            return false;
        }
        if (!entry.driver.user.empty() && entry.driver.password.empty()) {
            spdlog::error("Connection {} has a user but no password", entry.alias);
            return false;
        }
    }

    if (!master.empty() && findConnection(master) == nullptr) {
        spdlog::error("Master alias does not name a connection: {}", master);
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    const char* env_pwd = std::getenv("GRAPHLINK_PASSWORD");
    if (!env_pwd) {
        return;
    }
    for (auto& entry : connections) {
        if (!entry.driver.user.empty() && entry.driver.password.empty()) {
            entry.driver.password = env_pwd;
        }
    }
}

const ConnectionEntry* Config::findConnection(const std::string& alias) const {
    for (const auto& entry : connections) {
        if (entry.alias == alias) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace graphlink
