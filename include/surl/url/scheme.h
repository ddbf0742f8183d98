#pragma once
#include <surl/core/error.h>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace surl::url {

enum class Scheme {
    Http,
    Https,
    Ws,
    Wss,
};

// Case-insensitive. Unknown or empty text is UnsupportedScheme.
core::Result<Scheme> parse_scheme(std::string_view text);

// Lowercase canonical name, e.g. "https".
const char* scheme_name(Scheme scheme);

std::uint16_t default_port(Scheme scheme);

std::ostream& operator<<(std::ostream& os, Scheme scheme);

} // namespace surl::url
