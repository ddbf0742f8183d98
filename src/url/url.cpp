#include <surl/url/url.h>
#include <surl/url/percent_encoding.h>

#include <utility>

namespace surl::url {

std::string URL::serialize() const {
    std::string result = origin();

    result += path.to_string();

    if (!query.empty()) {
        result += '?';
        result += query.to_string();
    }

    if (fragment.has_value()) {
        result += '#';
        result += percent_encode(fragment.value(), EncodeSet::Fragment);
    }

    return result;
}

std::string URL::origin() const {
    std::string result;
    result += scheme_name(scheme);
    result += "://";
    result += host.to_string();

    if (port.has_value()) {
        result += ':';
        result += std::to_string(port.value());
    }

    return result;
}

URL URL::parent() const {
    URL result = *this;
    result.path.pop();
    return result;
}

URL make_url(Scheme scheme, host::Host host, std::optional<std::uint16_t> port,
             Path path, Query query, std::optional<std::string> fragment) {
    return URL{scheme, std::move(host), port, std::move(path), std::move(query),
               std::move(fragment)};
}

std::string serialize(const URL& url) {
    return url.serialize();
}

std::ostream& operator<<(std::ostream& os, const URL& url) {
    return os << url.serialize();
}

} // namespace surl::url
