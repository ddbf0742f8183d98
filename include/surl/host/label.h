#pragma once
#include <surl/core/error.h>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace surl::host {

// One dot-separated segment of a hostname, e.g. `example` in `example.com`.
// Only obtainable through parse(), so every instance is well-formed.
class Label {
public:
    static core::Result<Label> parse(std::string_view text);

    const std::string& str() const { return text_; }

    bool operator==(const Label& other) const = default;

private:
    explicit Label(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

std::ostream& operator<<(std::ostream& os, const Label& label);

} // namespace surl::host
