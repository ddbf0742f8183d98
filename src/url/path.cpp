#include <surl/url/path.h>
#include <surl/url/percent_encoding.h>

#include <utility>

namespace surl::url {

core::Result<Path> Path::parse(std::string_view text) {
    if (text.empty()) {
        return Path();
    }
    if (text.front() != '/') {
        return core::make_error(core::Errc::InvalidPath,
                                "'" + std::string(text) + "' is not absolute");
    }

    std::vector<std::string> segments;
    std::string_view rest = text.substr(1);
    if (rest.empty()) {
        return Path();
    }

    size_t pos = 0;
    while (true) {
        size_t slash = rest.find('/', pos);
        std::string_view raw = rest.substr(pos, slash == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : slash - pos);
        auto decoded = percent_decode(raw, EncodeSet::PathSegment);
        if (!decoded) {
            return decoded.error();
        }
        segments.push_back(std::move(decoded).value());
        if (slash == std::string_view::npos) break;
        pos = slash + 1;
    }

    return Path(std::move(segments));
}

void Path::push(std::string segment) {
    segments_.push_back(std::move(segment));
}

void Path::pop() {
    if (!segments_.empty()) {
        segments_.pop_back();
    }
}

Path Path::parent() const {
    Path result = *this;
    result.pop();
    return result;
}

std::string Path::to_string() const {
    std::string result = "/";
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) result += '/';
        result += percent_encode(segments_[i], EncodeSet::PathSegment);
    }
    return result;
}

} // namespace surl::url
