#include "DriverFactory.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace graphlink {

DriverFactory::DriverFactory(std::shared_ptr<DriverProvider> provider)
    : m_provider(std::move(provider)) {
    if (!m_provider) {
        throw std::invalid_argument("DriverFactory requires a driver provider");
    }
}

DriverConfig DriverFactory::boltConfig(const ResolvedUri& uri,
                                       const std::optional<DriverConfig>& config) const {
    // Timeouts, user agent and extras always come from the caller
    DriverConfig base = config.value_or(DriverConfig{});

    if (uri.hasCredentials()) {
        return base.withCredentials(*uri.user, *uri.password).withTlsMode(TlsMode::Required);
    }
    if (base.hasCredentials()) {
        return base;
    }
    return base.withCredentials(PLACEHOLDER_CREDENTIAL, PLACEHOLDER_CREDENTIAL);
}

BuiltDriver DriverFactory::build(const ResolvedUri& uri,
                                 const std::optional<DriverConfig>& config) const {
    BuiltDriver built;

    switch (uri.family) {
        case SchemeFamily::Bolt: {
            built.config = boltConfig(uri, config);
            auto address = uri.address();
            spdlog::debug("Building bolt driver for {} (tls {})", address,
                          DriverConfig::tlsModeToString(built.config.tls_mode));
            built.driver = m_provider->boltDriver(address, built.config);
            break;
        }
        case SchemeFamily::Http:
            built.config = config.value_or(DriverConfig{});
            spdlog::debug("Building http driver for {}", uri.original);
            built.driver = m_provider->httpDriver(uri.original, config);
            break;
        default:
            throw UnsupportedSchemeError(uri.original);
    }

    if (!built.driver) {
        throw std::runtime_error("Driver provider returned no driver for \"" + uri.original + "\"");
    }
    return built;
}

std::unique_ptr<Driver> DriverFactory::buildRouted(const std::string& address,
                                                   const DriverConfig& config) const {
    std::string target = address;
    if (target.find("://") == std::string::npos) {
        target = "bolt://" + target;
    }

    auto driver = m_provider->boltDriver(target, config);
    if (!driver) {
        throw std::runtime_error("Driver provider returned no driver for \"" + target + "\"");
    }
    return driver;
}

}  // namespace graphlink
