#include <surl/host/label.h>
#include <surl/core/config.h>

namespace surl::host {

namespace {

bool is_label_char(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-';
}

} // anonymous namespace

core::Result<Label> Label::parse(std::string_view text) {
    if (text.empty()) {
        return core::make_error(core::Errc::InvalidLabel, "empty label");
    }
    if (text.size() > core::config::kMaxLabelLength) {
        return core::make_error(core::Errc::InvalidLabel,
                                "label longer than " +
                                    std::to_string(core::config::kMaxLabelLength) +
                                    " characters");
    }
    for (char c : text) {
        if (!is_label_char(c)) {
            return core::make_error(core::Errc::InvalidLabel,
                                    "'" + std::string(text) + "' contains a character outside [A-Za-z0-9-]");
        }
    }
    if (text.front() == '-' || text.back() == '-') {
        return core::make_error(core::Errc::InvalidLabel,
                                "'" + std::string(text) + "' starts or ends with '-'");
    }
    return Label(std::string(text));
}

std::ostream& operator<<(std::ostream& os, const Label& label) {
    return os << label.str();
}

} // namespace surl::host
