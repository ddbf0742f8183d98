#pragma once
#include <surl/core/error.h>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace surl::url {

// Decoded key/value pairs with unique keys, iterated in sorted key order so
// serialization does not depend on insertion order.
class Query {
public:
    using Map = std::map<std::string, std::string>;
    using iterator = Map::const_iterator;

    Query() = default;
    Query(std::initializer_list<Map::value_type> pairs) : pairs_(pairs) {}

    // Parses `a=1&b=2`. A pair without '=' is InvalidQuery; when a key
    // repeats, the last value wins.
    static core::Result<Query> parse(std::string_view text);

    // Replaces any existing value for `key`.
    void set(std::string key, std::string value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    void erase(const std::string& key);

    size_t size() const { return pairs_.size(); }
    bool empty() const { return pairs_.empty(); }

    iterator begin() const { return pairs_.begin(); }
    iterator end() const { return pairs_.end(); }

    // Encoded `k=v&k=v` without the leading '?'; empty for an empty query.
    std::string to_string() const;

    bool operator==(const Query& other) const = default;

private:
    Map pairs_;
};

} // namespace surl::url
