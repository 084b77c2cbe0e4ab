#pragma once

/**
 * @file SessionManager.hpp
 * @brief Owner of the current driver and its lazily opened session.
 */

#include "Driver.hpp"
#include <memory>

namespace graphlink {

/**
 * @class SessionManager
 * @brief Holds the (driver, session) pair of a Connection.
 *
 * There are exactly two ways to change the pair:
 * - replaceDriver() installs a new driver and always drops the session.
 * - ensureSession() opens a session from the current driver when none is held.
 *
 * Consequently a session is never used against a driver other than the one
 * that created it.
 *
 * Thread Safety: none. The owning Connection is used by one caller at a time.
 */
class SessionManager {
public:
    /**
     * @brief Take ownership of the initial driver.
     * @throws std::invalid_argument if driver is null.
     */
    explicit SessionManager(std::unique_ptr<Driver> driver);

    /**
     * @brief Destructor - closes the session (if any) before the driver goes.
     */
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Swap in a new driver.
     * @param driver The replacement, must not be null.
     *
     * The held session is closed and released, so the next ensureSession()
     * opens a fresh one on the new driver. A failing Session::close() is
     * logged and does not stop the swap.
     */
    void replaceDriver(std::unique_ptr<Driver> driver);

    /**
     * @brief Return the held session, opening one first if needed.
     */
    Session& ensureSession();

    bool hasSession() const { return m_session != nullptr; }

    Driver& driver() const { return *m_driver; }

    /**
     * @brief Number of sessions opened so far, across all drivers.
     */
    size_t sessionsOpened() const { return m_sessionsOpened; }

private:
    void dropSession();

    // Declaration order matters: the session is destroyed before its driver
    std::unique_ptr<Driver> m_driver;
    std::unique_ptr<Session> m_session;
    size_t m_sessionsOpened = 0;
};

}  // namespace graphlink
