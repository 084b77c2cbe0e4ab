#pragma once

#include "Config.hpp"
#include "StatementClassifier.hpp"
#include "Types.hpp"
#include <string>
#include <vector>

namespace graphlink {

struct RoutingTable {
    std::vector<std::string> writeServers;
    std::vector<std::string> readServers;

    // Parse the first record of the routing procedure: value 1 holds a list of
    // {role, addresses} entries. Roles other than WRITE and READ are skipped.
    // Throws RoutingDiscoveryError on any other shape.
    static RoutingTable fromResult(const Result& result);

    const std::vector<std::string>& serversFor(AccessMode mode) const;

    static constexpr const char* ROLE_WRITE = "WRITE";
    static constexpr const char* ROLE_READ = "READ";
};

// Routing cache owned by a Connection
struct RoutingState {
    bool enabled = false;
    AccessMode lastMode = AccessMode::Unset;
    RoutingTable table;
    DriverConfig routingConfig;
};

}  // namespace graphlink
