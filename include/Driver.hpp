#pragma once

/**
 * @file Driver.hpp
 * @brief Abstract collaborators that carry statements to the database.
 *
 * The wire protocols themselves (Bolt message encoding, HTTP transport) live
 * outside this library. A protocol implementation plugs in by deriving from
 * Driver, Session, Pipeline and Transaction, and by supplying a DriverProvider
 * that knows how to construct its drivers.
 *
 * Protocol-level failures reported by the database must be thrown as
 * DriverError (see ErrorHandler.hpp) carrying the server status code.
 */

#include "Config.hpp"
#include "Types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace graphlink {

/**
 * @class Pipeline
 * @brief Statements queued for execution in a single round trip.
 */
class Pipeline {
public:
    virtual ~Pipeline() = default;

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Queue a statement.
     * @param text Cypher text.
     * @param parameters JSON object of statement parameters.
     * @param tag Optional tag copied onto the statement's Result.
     */
    virtual void push(const std::string& text,
                      const Parameters& parameters,
                      const std::optional<std::string>& tag = std::nullopt) = 0;

    /**
     * @brief Execute every queued statement.
     * @return One Result per pushed statement, in push order.
     */
    virtual ResultCollection run() = 0;

    /**
     * @brief Number of statements queued so far.
     */
    virtual size_t size() const = 0;

protected:
    Pipeline() = default;
};

/**
 * @class Transaction
 * @brief Explicit transaction opened on a session.
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    virtual Result run(const std::string& statement,
                       const Parameters& parameters,
                       const std::optional<std::string>& tag = std::nullopt) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;

    virtual bool isOpen() const = 0;

protected:
    Transaction() = default;
};

/**
 * @class Session
 * @brief Logical connection context bound to one driver.
 *
 * Sessions are NOT thread-safe. A session must outlive the pipelines and
 * transactions it creates.
 */
class Session {
public:
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Execute one statement and wait for its result.
     * @throws DriverError when the server rejects the statement.
     */
    virtual Result run(const std::string& statement,
                       const Parameters& parameters,
                       const std::optional<std::string>& tag = std::nullopt) = 0;

    /**
     * @brief Open a pipeline, optionally seeded with a first statement.
     */
    virtual std::unique_ptr<Pipeline> createPipeline(
        const std::optional<std::string>& query,
        const Parameters& parameters,
        const std::optional<std::string>& tag = std::nullopt) = 0;

    /**
     * @brief Begin an explicit transaction.
     */
    virtual std::unique_ptr<Transaction> transaction() = 0;

    /**
     * @brief Release the server-side resources of the session.
     *
     * Called exactly once by the owner right before the session object is
     * destroyed. A failure is logged by the owner and the session is
     * discarded regardless.
     */
    virtual void close() = 0;

protected:
    Session() = default;
};

/**
 * @class Driver
 * @brief Handle to one database endpoint, able to open sessions.
 */
class Driver {
public:
    virtual ~Driver() = default;

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    /**
     * @brief Open a new session against the endpoint.
     */
    virtual std::unique_ptr<Session> session() = 0;

    /**
     * @brief The URI or address this driver was built for.
     */
    virtual std::string uri() const = 0;

protected:
    Driver() = default;
};

/**
 * @class DriverProvider
 * @brief Factory hooks for the concrete protocol implementations.
 */
class DriverProvider {
public:
    virtual ~DriverProvider() = default;

    DriverProvider(const DriverProvider&) = delete;
    DriverProvider& operator=(const DriverProvider&) = delete;

    /**
     * @brief Build a binary-protocol driver.
     * @param uri Normalized "scheme://host:port" or routing-table address.
     * @param config Credentials, TLS mode and timeouts to use.
     */
    virtual std::unique_ptr<Driver> boltDriver(const std::string& uri,
                                               const DriverConfig& config) = 0;

    /**
     * @brief Build an HTTP driver.
     * @param uri The caller's URI, unchanged.
     * @param config The caller's configuration, unchanged.
     */
    virtual std::unique_ptr<Driver> httpDriver(const std::string& uri,
                                               const std::optional<DriverConfig>& config) = 0;

protected:
    DriverProvider() = default;
};

}  // namespace graphlink
