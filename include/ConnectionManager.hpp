#pragma once

#include "Config.hpp"
#include "Connection.hpp"
#include "Driver.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graphlink {

// Named connections of one client, one of which is the master
class ConnectionManager {
public:
    explicit ConnectionManager(std::shared_ptr<DriverProvider> provider);

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Construct and register a connection. Duplicate alias: std::invalid_argument.
    // Construction errors of the Connection propagate and nothing is registered.
    Connection& registerConnection(const std::string& alias,
                                   const std::string& uri,
                                   const std::optional<DriverConfig>& config = std::nullopt);

    // Register every entry of a loaded configuration, then apply its master
    void registerAll(const Config& config);

    // No alias means the master. Unknown alias: std::out_of_range.
    Connection& getConnection(const std::optional<std::string>& alias = std::nullopt);
    Connection& getMasterConnection();

    void setMaster(const std::string& alias);
    const std::string& masterAlias() const { return m_master; }

    bool hasConnection(const std::string& alias) const;
    size_t size() const { return m_connections.size(); }

    std::vector<std::string> aliases() const;

private:
    std::shared_ptr<DriverProvider> m_provider;
    std::map<std::string, std::unique_ptr<Connection>> m_connections;
    std::vector<std::string> m_order;
    std::string m_master;
};

}  // namespace graphlink
