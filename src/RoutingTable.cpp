#include "RoutingTable.hpp"
#include "ErrorHandler.hpp"

namespace graphlink {

RoutingTable RoutingTable::fromResult(const Result& result) {
    if (result.empty()) {
        throw RoutingDiscoveryError("Routing table query returned no records");
    }

    const auto& record = result.firstRecord();
    if (record.size() < 2) {
        throw RoutingDiscoveryError("Routing table record has " + std::to_string(record.size()) +
                                    " values, expected at least 2");
    }

    const auto& servers = record.value(1);
    if (!servers.is_array()) {
        throw RoutingDiscoveryError("Routing table servers entry is not a list: " + servers.dump());
    }

    RoutingTable table;
    for (const auto& server : servers) {
        if (!server.is_object() || !server.contains("role") || !server.contains("addresses")) {
            throw RoutingDiscoveryError("Malformed routing table entry: " + server.dump());
        }
        const auto& role = server["role"];
        const auto& addresses = server["addresses"];
        if (!role.is_string() || !addresses.is_array()) {
            throw RoutingDiscoveryError("Malformed routing table entry: " + server.dump());
        }

        std::vector<std::string>* target = nullptr;
        if (role == ROLE_WRITE) {
            target = &table.writeServers;
        } else if (role == ROLE_READ) {
            target = &table.readServers;
        } else {
            continue;
        }

        for (const auto& address : addresses) {
            if (!address.is_string()) {
                throw RoutingDiscoveryError("Routing table address is not a string: " + address.dump());
            }
            target->push_back(address.get<std::string>());
        }
    }

    return table;
}

const std::vector<std::string>& RoutingTable::serversFor(AccessMode mode) const {
    return mode == AccessMode::Write ? writeServers : readServers;
}

}  // namespace graphlink
