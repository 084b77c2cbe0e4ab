#include "ConnectionManager.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace graphlink {

ConnectionManager::ConnectionManager(std::shared_ptr<DriverProvider> provider)
    : m_provider(std::move(provider)) {
    if (!m_provider) {
        throw std::invalid_argument("ConnectionManager requires a driver provider");
    }
}

Connection& ConnectionManager::registerConnection(const std::string& alias,
                                                  const std::string& uri,
                                                  const std::optional<DriverConfig>& config) {
    if (alias.empty()) {
        throw std::invalid_argument("Connection alias must not be empty");
    }
    if (hasConnection(alias)) {
        throw std::invalid_argument("Connection with alias \"" + alias + "\" already registered");
    }

    auto connection = std::make_unique<Connection>(alias, uri, m_provider, config);
    auto& ref = *connection;
    m_connections.emplace(alias, std::move(connection));
    m_order.push_back(alias);

    if (m_master.empty()) {
        m_master = alias;
    }

    spdlog::info("Registered connection '{}' ({})", alias, uri);
    return ref;
}

void ConnectionManager::registerAll(const Config& config) {
    for (const auto& entry : config.connections) {
        registerConnection(entry.alias, entry.uri, entry.driver);
    }
    if (!config.master.empty()) {
        setMaster(config.master);
    }
}

Connection& ConnectionManager::getConnection(const std::optional<std::string>& alias) {
    if (!alias) {
        return getMasterConnection();
    }
    auto it = m_connections.find(*alias);
    if (it == m_connections.end()) {
        throw std::out_of_range("No connection registered with alias \"" + *alias + "\"");
    }
    return *it->second;
}

Connection& ConnectionManager::getMasterConnection() {
    if (m_master.empty()) {
        throw std::out_of_range("No connection registered");
    }
    return getConnection(m_master);
}

void ConnectionManager::setMaster(const std::string& alias) {
    if (!hasConnection(alias)) {
        throw std::out_of_range("No connection registered with alias \"" + alias + "\"");
    }
    m_master = alias;
}

bool ConnectionManager::hasConnection(const std::string& alias) const {
    return m_connections.find(alias) != m_connections.end();
}

std::vector<std::string> ConnectionManager::aliases() const {
    return m_order;
}

}  // namespace graphlink
