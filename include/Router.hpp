#pragma once

#include "DriverFactory.hpp"
#include "RoutingTable.hpp"
#include "ServerSelector.hpp"
#include "SessionManager.hpp"
#include "StatementClassifier.hpp"
#include <optional>
#include <string_view>

namespace graphlink {

// Read/write routing for routed bolt clusters. Owns no state of its own: it
// mutates the RoutingState and SessionManager of its Connection.
class Router {
public:
    Router(RoutingState& state,
           SessionManager& sessions,
           const DriverFactory& factory,
           ServerSelector& selector);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Fetch the routing table through the current driver, enable routing and
    // force Write mode. Throws RoutingDiscoveryError or RoutingExhaustedError.
    void discover(const DriverConfig& config);

    // Move to a server of the class the statement (or forceMode) needs.
    // Returns true if the driver was replaced.
    bool checkUpdateServerBoltRouting(std::optional<std::string_view> statement,
                                      std::optional<AccessMode> forceMode = std::nullopt);

    // Mode forced after every successful run
    static constexpr AccessMode kResetModeAfterRun = AccessMode::Write;

    static constexpr const char* ROUTING_TABLE_QUERY = "CALL dbms.routing.getRoutingTable({})";

private:
    void switchTo(AccessMode mode);

    RoutingState& m_state;
    SessionManager& m_sessions;
    const DriverFactory& m_factory;
    ServerSelector& m_selector;
};

}  // namespace graphlink
