#pragma once

#include "Config.hpp"
#include "Driver.hpp"
#include "UriResolver.hpp"
#include <memory>
#include <optional>
#include <string>

namespace graphlink {

struct BuiltDriver {
    std::unique_ptr<Driver> driver;
    DriverConfig config;    // effective configuration the driver was built with
};

class DriverFactory {
public:
    explicit DriverFactory(std::shared_ptr<DriverProvider> provider);

    // Non-copyable
    DriverFactory(const DriverFactory&) = delete;
    DriverFactory& operator=(const DriverFactory&) = delete;

    // Build the initial driver for a resolved URI
    BuiltDriver build(const ResolvedUri& uri, const std::optional<DriverConfig>& config) const;

    // Build a bolt driver for a routing-table address
    std::unique_ptr<Driver> buildRouted(const std::string& address, const DriverConfig& config) const;

    // Credentials handed to servers running without authentication
    static constexpr const char* PLACEHOLDER_CREDENTIAL = "null";

private:
    DriverConfig boltConfig(const ResolvedUri& uri, const std::optional<DriverConfig>& config) const;

    std::shared_ptr<DriverProvider> m_provider;
};

}  // namespace graphlink
