#include <surl/url/query.h>
#include <surl/url/percent_encoding.h>

namespace surl::url {

core::Result<Query> Query::parse(std::string_view text) {
    Query query;
    if (text.empty()) {
        return query;
    }

    size_t pos = 0;
    while (true) {
        size_t amp = text.find('&', pos);
        std::string_view pair = text.substr(pos, amp == std::string_view::npos
                                                     ? std::string_view::npos
                                                     : amp - pos);

        size_t eq = pair.find('=');
        if (eq == std::string_view::npos) {
            return core::make_error(core::Errc::InvalidQuery,
                                    "pair '" + std::string(pair) + "' has no '='");
        }

        auto key = percent_decode(pair.substr(0, eq), EncodeSet::Query);
        if (!key) {
            return key.error();
        }
        auto value = percent_decode(pair.substr(eq + 1), EncodeSet::Query);
        if (!value) {
            return value.error();
        }
        query.set(std::move(key).value(), std::move(value).value());

        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }

    return query;
}

void Query::set(std::string key, std::string value) {
    pairs_.insert_or_assign(std::move(key), std::move(value));
}

std::optional<std::string> Query::get(const std::string& key) const {
    auto it = pairs_.find(key);
    if (it == pairs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Query::contains(const std::string& key) const {
    return pairs_.count(key) > 0;
}

void Query::erase(const std::string& key) {
    pairs_.erase(key);
}

std::string Query::to_string() const {
    std::string result;
    bool first = true;
    for (const auto& [key, value] : pairs_) {
        if (!first) result += '&';
        first = false;
        result += percent_encode(key, EncodeSet::Query);
        result += '=';
        result += percent_encode(value, EncodeSet::Query);
    }
    return result;
}

} // namespace surl::url
