#include <surl/host/host.h>
#include <surl/core/config.h>

#include <optional>

namespace surl::host {

core::Result<Host> Host::parse(std::string_view text) {
    std::optional<Label> name;
    std::vector<Label> domains;

    size_t pos = 0;
    while (true) {
        size_t dot = text.find('.', pos);
        std::string_view raw = text.substr(pos, dot == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : dot - pos);
        auto label = Label::parse(raw);
        if (!label) {
            return label.error();
        }
        if (!name) {
            name = std::move(label).value();
        } else {
            domains.push_back(std::move(label).value());
        }
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }

    return make(std::move(*name), std::move(domains));
}

core::Result<Host> Host::make(Label name, std::vector<Label> domains) {
    if (domains.size() + 1 < core::config::kMinHostLabels) {
        return core::make_error(core::Errc::InvalidHost,
                                "'" + name.str() + "' needs at least " +
                                    std::to_string(core::config::kMinHostLabels) +
                                    " labels");
    }
    return Host(std::move(name), std::move(domains));
}

std::string Host::to_string() const {
    std::string result = name_.str();
    for (const auto& domain : domains_) {
        result += '.';
        result += domain.str();
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Host& host) {
    return os << host.to_string();
}

} // namespace surl::host
