#include <surl/url/scheme.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace surl::url {

core::Result<Scheme> parse_scheme(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "http")  return Scheme::Http;
    if (lower == "https") return Scheme::Https;
    if (lower == "ws")    return Scheme::Ws;
    if (lower == "wss")   return Scheme::Wss;

    return core::make_error(core::Errc::UnsupportedScheme, "'" + std::string(text) + "'");
}

const char* scheme_name(Scheme scheme) {
    switch (scheme) {
        case Scheme::Http:  return "http";
        case Scheme::Https: return "https";
        case Scheme::Ws:    return "ws";
        case Scheme::Wss:   return "wss";
    }
    return "http";
}

std::uint16_t default_port(Scheme scheme) {
    switch (scheme) {
        case Scheme::Http:  return 80;
        case Scheme::Https: return 443;
        case Scheme::Ws:    return 80;
        case Scheme::Wss:   return 443;
    }
    return 80;
}

std::ostream& operator<<(std::ostream& os, Scheme scheme) {
    return os << scheme_name(scheme);
}

} // namespace surl::url
