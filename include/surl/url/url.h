#pragma once
#include <surl/core/diagnostics.h>
#include <surl/core/error.h>
#include <surl/host/host.h>
#include <surl/url/path.h>
#include <surl/url/query.h>
#include <surl/url/scheme.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace surl::url {

// A URL as structured fields. Every field validates itself, so a URL built
// from valid parts always serializes.
struct URL {
    Scheme scheme;
    surl::host::Host host;
    std::optional<std::uint16_t> port;
    Path path;
    Query query;
    std::optional<std::string> fragment;

    std::string serialize() const;

    // scheme://host[:port]
    std::string origin() const;

    // Same URL with the last path segment removed.
    URL parent() const;

    bool operator==(const URL& other) const = default;
};

URL make_url(Scheme scheme, host::Host host, std::optional<std::uint16_t> port,
             Path path, Query query, std::optional<std::string> fragment);

// Stops at the first invalid component. When `diagnostics` is given, the
// failing stage is reported to it.
core::Result<URL> parse(std::string_view input, core::DiagnosticEmitter* diagnostics = nullptr);

std::string serialize(const URL& url);

std::ostream& operator<<(std::ostream& os, const URL& url);

} // namespace surl::url
