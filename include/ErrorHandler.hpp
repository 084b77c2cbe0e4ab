#pragma once

#include <string>
#include <optional>
#include <stdexcept>

namespace graphlink {

// Parsed form of a server status code, e.g. Neo.ClientError.Statement.SyntaxError
struct StatusCode {
    std::string classification;
    std::string category;
    std::string title;
};

// Status code inspection helpers
class ErrorHandler {
public:
    // Split a dotted status code, nullopt if it is not of the Neo.X.Y.Z form
    static std::optional<StatusCode> parseStatusCode(const std::string& code);

    // Classification checks
    static bool isClientError(const std::string& code);
    static bool isTransient(const std::string& code);
    static bool isDatabaseError(const std::string& code);

    // Check if error indicates the connection or cluster membership is gone
    static bool isConnectionError(const std::string& code);

    // Get human-readable error message
    static std::string getErrorMessage(const std::string& code, const std::string& message);

    static constexpr const char* CLIENT_ERROR = "ClientError";
    static constexpr const char* CLIENT_NOTIFICATION = "ClientNotification";
    static constexpr const char* TRANSIENT_ERROR = "TransientError";
    static constexpr const char* DATABASE_ERROR = "DatabaseError";
};

// Failure reported by a driver implementation for a rejected message
class DriverError : public std::runtime_error {
public:
    DriverError(std::string statusCode, const std::string& message);

    const std::string& statusCode() const { return m_statusCode; }

private:
    std::string m_statusCode;
};

// Domain error surfaced by Connection::run
class GraphException : public std::runtime_error {
public:
    GraphException(std::string statusCode, const std::string& message);
    explicit GraphException(const DriverError& error);

    const std::string& statusCode() const { return m_statusCode; }

    std::string classification() const;
    std::string category() const;
    std::string title() const;

private:
    std::string m_statusCode;
};

// The URI names a protocol no driver is available for
class UnsupportedSchemeError : public std::runtime_error {
public:
    explicit UnsupportedSchemeError(const std::string& uri);

    const std::string& uri() const { return m_uri; }

private:
    std::string m_uri;
};

class RoutingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Routing table could not be fetched or has an unexpected shape
class RoutingDiscoveryError : public RoutingError {
public:
    using RoutingError::RoutingError;
};

// No server left to route to
class RoutingExhaustedError : public RoutingError {
public:
    using RoutingError::RoutingError;
};

}  // namespace graphlink
