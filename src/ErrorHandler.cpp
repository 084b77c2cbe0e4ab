#include "ErrorHandler.hpp"
#include <vector>

namespace graphlink {

namespace {

std::vector<std::string> splitDots(const std::string& code) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : code) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

}  // namespace

std::optional<StatusCode> ErrorHandler::parseStatusCode(const std::string& code) {
    auto parts = splitDots(code);
    if (parts.size() != 4 || parts[0] != "Neo") {
        return std::nullopt;
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            return std::nullopt;
        }
    }
    return StatusCode{parts[1], parts[2], parts[3]};
}

bool ErrorHandler::isClientError(const std::string& code) {
    auto status = parseStatusCode(code);
    return status && status->classification == CLIENT_ERROR;
}

bool ErrorHandler::isTransient(const std::string& code) {
    auto status = parseStatusCode(code);
    return status && status->classification == TRANSIENT_ERROR;
}

bool ErrorHandler::isDatabaseError(const std::string& code) {
    auto status = parseStatusCode(code);
    return status && status->classification == DATABASE_ERROR;
}

bool ErrorHandler::isConnectionError(const std::string& code) {
    auto status = parseStatusCode(code);
    if (!status) {
        return false;
    }
    if (status->category == "Cluster") {
        // NotALeader, ReplicationFailure, ... mean this member can't take the statement
        return true;
    }
    return status->category == "General" && status->title == "DatabaseUnavailable";
}

std::string ErrorHandler::getErrorMessage(const std::string& code, const std::string& message) {
    if (code.empty()) {
        return message;
    }
    if (message.empty()) {
        return code;
    }
    return code + ": " + message;
}

DriverError::DriverError(std::string status_code, const std::string& message)
    : std::runtime_error(message)
    , m_statusCode(std::move(status_code)) {
}

GraphException::GraphException(std::string status_code, const std::string& message)
    : std::runtime_error(message)
    , m_statusCode(std::move(status_code)) {
}

GraphException::GraphException(const DriverError& error)
    : std::runtime_error(error.what())
    , m_statusCode(error.statusCode()) {
}

std::string GraphException::classification() const {
    auto status = ErrorHandler::parseStatusCode(m_statusCode);
    return status ? status->classification : std::string();
}

std::string GraphException::category() const {
    auto status = ErrorHandler::parseStatusCode(m_statusCode);
    return status ? status->category : std::string();
}

std::string GraphException::title() const {
    auto status = ErrorHandler::parseStatusCode(m_statusCode);
    return status ? status->title : std::string();
}

UnsupportedSchemeError::UnsupportedSchemeError(const std::string& uri)
    : std::runtime_error("Unable to build a driver from uri \"" + uri + "\"")
    , m_uri(uri) {
}

}  // namespace graphlink
