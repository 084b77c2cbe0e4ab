#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <filesystem>

namespace graphlink {

enum class TlsMode {
    Disabled,
    Optional,
    Required
};

// Settings handed to a driver implementation.
struct DriverConfig {
    std::string user;
    std::string password;
    TlsMode tls_mode = TlsMode::Optional;

    // Timeouts
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds socket_timeout{30000};

    std::string user_agent = "graphlink/1.0";

    // Driver-specific extras passed through untouched
    std::map<std::string, std::string> options;

    bool hasCredentials() const { return !user.empty(); }

    DriverConfig withCredentials(const std::string& user, const std::string& password) const;
    DriverConfig withTlsMode(TlsMode mode) const;

    static std::optional<TlsMode> parseTlsMode(const std::string& value);
    static std::string tlsModeToString(TlsMode mode);
};

struct ConnectionEntry {
    std::string alias;
    std::string uri;
    DriverConfig driver;
};

struct Config {
    std::vector<ConnectionEntry> connections;
    std::string master;

    std::vector<std::string> statements;

    bool debug = false;
    std::string log_file;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();

    // Find connection by alias, nullptr if absent
    const ConnectionEntry* findConnection(const std::string& alias) const;
};

}  // namespace graphlink
