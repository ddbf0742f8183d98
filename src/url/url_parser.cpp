#include <surl/url/url.h>
#include <surl/url/percent_encoding.h>
#include <surl/core/config.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace surl::url {

namespace {

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool all_digits(std::string_view text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!is_ascii_digit(c)) return false;
    }
    return true;
}

// `part` must be a view into `input`.
std::size_t offset_in(std::string_view input, std::string_view part) {
    return static_cast<std::size_t>(part.data() - input.data());
}

// Reports the failure (if anyone is listening) and hands the error back.
core::Error fail(core::DiagnosticEmitter* diagnostics, const char* stage,
                 std::string_view input, std::string_view part, core::Error error) {
    if (diagnostics) {
        diagnostics->report_failure(stage, input, offset_in(input, part), error);
    }
    return error;
}

core::Result<std::uint16_t> parse_port(std::string_view digits) {
    std::uint32_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
        if (value > core::config::kMaxPort) {
            return core::make_error(core::Errc::InvalidPort,
                                    "'" + std::string(digits) + "' is out of range");
        }
    }
    return static_cast<std::uint16_t>(value);
}

} // anonymous namespace

core::Result<URL> parse(std::string_view input, core::DiagnosticEmitter* diagnostics) {
    // 1. scheme
    size_t sep = input.find(core::config::kSchemeSeparator);
    if (sep == std::string_view::npos) {
        return fail(diagnostics, "scheme", input, input,
                    core::make_error(core::Errc::MissingScheme, "no '://' found"));
    }
    auto scheme = parse_scheme(input.substr(0, sep));
    if (!scheme) {
        return fail(diagnostics, "scheme", input, input, scheme.error());
    }
    std::string_view remaining = input.substr(sep + std::string_view(core::config::kSchemeSeparator).size());

    // 2. authority runs up to the first '/', '?' or '#'
    size_t authority_end = remaining.find_first_of("/?#");
    std::string_view authority = remaining.substr(0, authority_end);
    std::string_view rest = authority_end == std::string_view::npos
                                ? remaining.substr(remaining.size())
                                : remaining.substr(authority_end);

    // 3. host[:port], split at the last ':' only when digits follow it
    std::string_view host_text = authority;
    std::optional<std::uint16_t> port;
    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos && all_digits(authority.substr(colon + 1))) {
        std::string_view digits = authority.substr(colon + 1);
        auto parsed_port = parse_port(digits);
        if (!parsed_port) {
            return fail(diagnostics, "port", input, digits, parsed_port.error());
        }
        port = parsed_port.value();
        host_text = authority.substr(0, colon);
    }
    auto parsed_host = host::Host::parse(host_text);
    if (!parsed_host) {
        return fail(diagnostics, "host", input, host_text, parsed_host.error());
    }

    // 4. path
    size_t path_end = rest.find_first_of("?#");
    std::string_view path_text = rest.substr(0, path_end);
    auto path = Path::parse(path_text);
    if (!path) {
        return fail(diagnostics, "path", input, path_text, path.error());
    }
    rest = rest.substr(path_end == std::string_view::npos ? rest.size() : path_end);

    // 5. query
    Query query;
    if (!rest.empty() && rest.front() == '?') {
        size_t hash = rest.find('#');
        std::string_view query_text = rest.substr(1, hash == std::string_view::npos
                                                         ? std::string_view::npos
                                                         : hash - 1);
        auto parsed_query = Query::parse(query_text);
        if (!parsed_query) {
            return fail(diagnostics, "query", input, query_text, parsed_query.error());
        }
        query = std::move(parsed_query).value();
        rest = rest.substr(hash == std::string_view::npos ? rest.size() : hash);
    }

    // 6. fragment
    std::optional<std::string> fragment;
    if (!rest.empty() && rest.front() == '#') {
        std::string_view fragment_text = rest.substr(1);
        auto decoded = percent_decode(fragment_text, EncodeSet::Fragment);
        if (!decoded) {
            return fail(diagnostics, "fragment", input, fragment_text, decoded.error());
        }
        fragment = std::move(decoded).value();
    }

    URL url = make_url(scheme.value(), std::move(parsed_host).value(), port,
                       std::move(path).value(), std::move(query), std::move(fragment));
    if (diagnostics) {
        diagnostics->report_parsed(input, url.serialize());
    }
    return url;
}

} // namespace surl::url
