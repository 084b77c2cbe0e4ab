#include "Router.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace graphlink {

Router::Router(RoutingState& state,
               SessionManager& sessions,
               const DriverFactory& factory,
               ServerSelector& selector)
    : m_state(state)
    , m_sessions(sessions)
    , m_factory(factory)
    , m_selector(selector) {
}

void Router::discover(const DriverConfig& config) {
    Result result;
    try {
        result = m_sessions.ensureSession().run(ROUTING_TABLE_QUERY, Parameters::object());
    } catch (const DriverError& e) {
        throw RoutingDiscoveryError(std::string("Routing table query failed: ") +
                                    ErrorHandler::getErrorMessage(e.statusCode(), e.what()));
    } catch (const RoutingError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw RoutingDiscoveryError(std::string("Routing table query failed: ") + e.what());
    }

    m_state.table = RoutingTable::fromResult(result);
    m_state.enabled = true;
    m_state.routingConfig = config;

    spdlog::info("Discovered routing table via {}: {} write, {} read servers",
                 m_sessions.driver().uri(),
                 m_state.table.writeServers.size(),
                 m_state.table.readServers.size());

    checkUpdateServerBoltRouting(std::nullopt, AccessMode::Write);
}

bool Router::checkUpdateServerBoltRouting(std::optional<std::string_view> statement,
                                          std::optional<AccessMode> forceMode) {
    if (!m_state.enabled) {
        return false;
    }

    std::optional<AccessMode> mode;
    if (statement) {
        mode = StatementClassifier::classify(*statement);
    }

    if (m_state.lastMode != AccessMode::Write &&
        (mode == AccessMode::Write || forceMode == AccessMode::Write)) {
        switchTo(AccessMode::Write);
        return true;
    }
    if (m_state.lastMode != AccessMode::Read &&
        (mode == AccessMode::Read || forceMode == AccessMode::Read)) {
        switchTo(AccessMode::Read);
        return true;
    }
    return false;
}

void Router::switchTo(AccessMode mode) {
    // Select and build first: a failure leaves mode, driver and session untouched
    const auto& address = m_selector.select(m_state.table.serversFor(mode));
    auto driver = m_factory.buildRouted(address, m_state.routingConfig);

    spdlog::debug("Routing {} -> {} via {}",
                  StatementClassifier::modeToString(m_state.lastMode),
                  StatementClassifier::modeToString(mode), address);

    m_state.lastMode = mode;
    m_sessions.replaceDriver(std::move(driver));
}

}  // namespace graphlink
