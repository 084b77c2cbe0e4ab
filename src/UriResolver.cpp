#include "UriResolver.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace graphlink {

namespace {

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string ResolvedUri::address() const {
    std::string result = scheme + "://";
    if (host.find(':') != std::string::npos) {
        result += "[" + host + "]";
    } else {
        result += host;
    }
    result += ":" + std::to_string(port);
    return result;
}

std::optional<SchemeFamily> UriResolver::schemeFamily(std::string_view scheme) {
    auto lower = toLower(scheme);
    if (lower.compare(0, 4, "bolt") == 0) {
        return SchemeFamily::Bolt;
    }
    if (lower == "http" || lower == "https") {
        return SchemeFamily::Http;
    }
    return std::nullopt;
}

bool UriResolver::isRoutingScheme(std::string_view scheme) {
    auto lower = toLower(scheme);
    return lower.compare(0, 4, "bolt") == 0 &&
           (lower.find("+routing") != std::string::npos ||
            lower.find("-routing") != std::string::npos);
}

uint16_t UriResolver::defaultPort(std::string_view scheme) {
    auto lower = toLower(scheme);
    if (lower == "https") return HTTPS_DEFAULT_PORT;
    if (lower == "http") return HTTP_DEFAULT_PORT;
    return BOLT_DEFAULT_PORT;
}

std::string UriResolver::familyToString(SchemeFamily family) {
    switch (family) {
        case SchemeFamily::Bolt: return "bolt";
        case SchemeFamily::Http: return "http";
    }
    return "unknown";
}

std::string UriResolver::percentDecode(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

uint16_t UriResolver::parsePort(std::string_view text, std::string_view uri) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid port '" + std::string(text) + "' in uri \"" +
                                    std::string(uri) + "\"");
    }
    unsigned long port = std::stoul(std::string(text));
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("Port out of range in uri \"" + std::string(uri) + "\"");
    }
    return static_cast<uint16_t>(port);
}

ResolvedUri UriResolver::resolve(std::string_view uri) const {
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        throw UnsupportedSchemeError(std::string(uri));
    }

    ResolvedUri result;
    result.original = std::string(uri);
    result.scheme = toLower(uri.substr(0, scheme_end));

    auto family = schemeFamily(result.scheme);
    if (!family) {
        throw UnsupportedSchemeError(result.original);
    }
    result.family = *family;
    result.routing = isRoutingScheme(result.scheme);

    // Authority runs up to the first path, query or fragment delimiter
    auto rest = uri.substr(scheme_end + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));

    auto at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        auto userinfo = authority.substr(0, at_pos);
        authority = authority.substr(at_pos + 1);

        auto colon = userinfo.find(':');
        if (colon != std::string_view::npos) {
            result.user = percentDecode(userinfo.substr(0, colon));
            result.password = percentDecode(userinfo.substr(colon + 1));
        } else if (!userinfo.empty()) {
            result.user = percentDecode(userinfo);
        }
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("Unterminated IPv6 host in uri \"" + result.original + "\"");
        }
        result.host = std::string(authority.substr(1, close - 1));
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw std::invalid_argument("Unexpected text after host in uri \"" +
                                            result.original + "\"");
            }
            port_text = tail.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            result.host = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
        } else {
            result.host = std::string(authority);
        }
    }

    if (result.host.empty()) {
        throw std::invalid_argument("Missing host in uri \"" + result.original + "\"");
    }

    result.port = port_text.empty() ? defaultPort(result.scheme) : parsePort(port_text, uri);

    return result;
}

}  // namespace graphlink
