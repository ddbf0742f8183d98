#pragma once
#include <surl/core/error.h>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace surl::url {

// Absolute path held as decoded segments. `/some/path` is {"some", "path"};
// the root `/` has no segments and a trailing slash is an empty last segment.
class Path {
public:
    Path() = default;
    explicit Path(std::vector<std::string> segments) : segments_(std::move(segments)) {}
    Path(std::initializer_list<std::string> segments) : segments_(segments) {}

    // Parses the encoded path component of a URL. Empty text is the root.
    static core::Result<Path> parse(std::string_view text);

    const std::vector<std::string>& segments() const { return segments_; }
    bool is_root() const { return segments_.empty(); }

    void push(std::string segment);
    void pop();
    Path parent() const;

    // Always starts with '/'.
    std::string to_string() const;

    bool operator==(const Path& other) const = default;

private:
    std::vector<std::string> segments_;
};

} // namespace surl::url
