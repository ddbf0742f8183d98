#pragma once
#include <surl/core/error.h>
#include <surl/host/label.h>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace surl::host {

// A fully-qualified host name. For `vm1.example.com`, name is `vm1` and
// domains are [`example`, `com`] in written order. Always has at least two
// labels; the only ways in are parse() and make().
class Host {
public:
    // Splits on '.'.
    static core::Result<Host> parse(std::string_view text);

    // InvalidHost when `domains` is empty.
    static core::Result<Host> make(Label name, std::vector<Label> domains);

    const Label& name() const { return name_; }
    const std::vector<Label>& domains() const { return domains_; }

    std::string to_string() const;

    bool operator==(const Host& other) const = default;

private:
    Host(Label name, std::vector<Label> domains)
        : name_(std::move(name)), domains_(std::move(domains)) {}

    Label name_;
    std::vector<Label> domains_;
};

std::ostream& operator<<(std::ostream& os, const Host& host);

} // namespace surl::host
