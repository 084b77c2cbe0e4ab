#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace graphlink {

Connection::Connection(std::string alias,
                       std::string uri,
                       std::shared_ptr<DriverProvider> provider,
                       std::optional<DriverConfig> config,
                       std::unique_ptr<ServerSelector> selector)
    : m_alias(std::move(alias))
    , m_uri(std::move(uri))
    , m_config(std::move(config))
    , m_resolved(UriResolver().resolve(m_uri))
    , m_factory(std::move(provider))
    , m_selector(selector ? std::move(selector) : std::make_unique<RandomServerSelector>()) {

    auto built = m_factory.build(m_resolved, m_config);
    m_sessions = std::make_unique<SessionManager>(std::move(built.driver));
    m_router = std::make_unique<Router>(m_routing, *m_sessions, m_factory, *m_selector);

    if (m_resolved.family == SchemeFamily::Bolt && m_resolved.routing) {
        m_router->discover(built.config);
    }

    spdlog::debug("Connection '{}' ready on {}{}", m_alias, m_sessions->driver().uri(),
                  m_routing.enabled ? " (routing)" : "");
}

Connection::~Connection() = default;

Driver& Connection::getDriver() const {
    return m_sessions->driver();
}

Session& Connection::getSession() {
    return m_sessions->ensureSession();
}

Parameters Connection::normalizeParameters(const Parameters& parameters) {
    if (parameters.is_null()) {
        return Parameters::object();
    }
    if (!parameters.is_object()) {
        throw std::invalid_argument("Expected statement parameters as a map, got " +
                                    std::string(parameters.type_name()));
    }
    return parameters;
}

std::unique_ptr<Pipeline> Connection::createPipeline(const std::optional<std::string>& query,
                                                     const Parameters& parameters,
                                                     const std::optional<std::string>& tag) {
    auto& session = m_sessions->ensureSession();
    return session.createPipeline(query, normalizeParameters(parameters), tag);
}

Result Connection::run(const std::string& statement,
                       const Parameters& parameters,
                       const std::optional<std::string>& tag) {
    if (statement.empty()) {
        throw std::invalid_argument("Expected a non-empty Cypher statement, got \"\"");
    }
    auto normalized = normalizeParameters(parameters);

    // Routing may drop the session, so it has to be resolved before ensureSession()
    m_router->checkUpdateServerBoltRouting(statement);
    auto& session = m_sessions->ensureSession();

    Result result;
    try {
        result = session.run(statement, normalized, tag);
    } catch (const DriverError& e) {
        throw GraphException(e);
    }

    m_router->checkUpdateServerBoltRouting(statement, Router::kResetModeAfterRun);
    return result;
}

ResultCollection Connection::runMixed(const Queue& queue) {
    auto pipeline = createPipeline();

    for (const auto& element : queue) {
        if (auto stack = std::dynamic_pointer_cast<const StatementStack>(element)) {
            for (const auto& statement : stack->statements()) {
                pipeline->push(statement.text(), statement.parameters(), statement.tag());
            }
        } else if (auto statement = std::dynamic_pointer_cast<const Statement>(element)) {
            pipeline->push(statement->text(), statement->parameters(), statement->tag());
        }
    }

    return pipeline->run();
}

std::unique_ptr<Transaction> Connection::getTransaction() {
    return m_sessions->ensureSession().transaction();
}

}  // namespace graphlink
