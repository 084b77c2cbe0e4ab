#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace graphlink {

enum class SchemeFamily {
    Bolt,
    Http
};

struct ResolvedUri {
    std::string original;
    std::string scheme;          // lower-cased, e.g. "bolt+routing"
    SchemeFamily family = SchemeFamily::Bolt;
    std::string host;
    uint16_t port = 0;
    std::optional<std::string> user;
    std::optional<std::string> password;
    bool routing = false;

    bool hasCredentials() const { return user.has_value() && password.has_value(); }

    // "scheme://host:port", IPv6 hosts re-bracketed
    std::string address() const;
};

class UriResolver {
public:
    UriResolver() = default;

    // Throws UnsupportedSchemeError or std::invalid_argument
    ResolvedUri resolve(std::string_view uri) const;

    static std::optional<SchemeFamily> schemeFamily(std::string_view scheme);
    static bool isRoutingScheme(std::string_view scheme);
    static uint16_t defaultPort(std::string_view scheme);

    static std::string familyToString(SchemeFamily family);

    static constexpr uint16_t BOLT_DEFAULT_PORT = 7687;
    static constexpr uint16_t HTTP_DEFAULT_PORT = 7474;
    static constexpr uint16_t HTTPS_DEFAULT_PORT = 7473;

private:
    static std::string percentDecode(std::string_view text);
    static uint16_t parsePort(std::string_view text, std::string_view uri);
};

}  // namespace graphlink
