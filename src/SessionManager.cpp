#include "SessionManager.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace graphlink {

SessionManager::SessionManager(std::unique_ptr<Driver> driver)
    : m_driver(std::move(driver)) {
    if (!m_driver) {
        throw std::invalid_argument("SessionManager requires a driver");
    }
}

SessionManager::~SessionManager() {
    dropSession();
}

void SessionManager::replaceDriver(std::unique_ptr<Driver> driver) {
    if (!driver) {
        throw std::invalid_argument("Cannot replace driver with null");
    }
    dropSession();
    m_driver = std::move(driver);
}

Session& SessionManager::ensureSession() {
    if (!m_session) {
        m_session = m_driver->session();
        if (!m_session) {
            throw std::runtime_error("Driver for " + m_driver->uri() + " returned no session");
        }
        ++m_sessionsOpened;
        spdlog::debug("Opened session on {}", m_driver->uri());
    }
    return *m_session;
}

void SessionManager::dropSession() {
    if (!m_session) {
        return;
    }
    try {
        m_session->close();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to close session on {}: {}", m_driver->uri(), e.what());
    }
    m_session.reset();
}

}  // namespace graphlink
