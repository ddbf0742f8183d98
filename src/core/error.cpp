#include <surl/core/error.h>

namespace surl::core {

namespace {

struct ErrorCategoryImpl final : std::error_category {
    const char* name() const noexcept override { return "surl"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::InvalidLabel:      return "invalid host label";
            case Errc::InvalidHost:       return "invalid host";
            case Errc::UnsupportedScheme: return "unsupported scheme";
            case Errc::MissingScheme:     return "missing scheme separator";
            case Errc::InvalidPort:       return "invalid port";
            case Errc::InvalidPath:       return "invalid path";
            case Errc::InvalidQuery:      return "invalid query";
            case Errc::InvalidEncoding:   return "invalid percent-encoding";
        }
        return "unknown surl error";
    }
};

} // anonymous namespace

const char* errc_name(Errc code) {
    switch (code) {
        case Errc::InvalidLabel:      return "InvalidLabel";
        case Errc::InvalidHost:       return "InvalidHost";
        case Errc::UnsupportedScheme: return "UnsupportedScheme";
        case Errc::MissingScheme:     return "MissingScheme";
        case Errc::InvalidPort:       return "InvalidPort";
        case Errc::InvalidPath:       return "InvalidPath";
        case Errc::InvalidQuery:      return "InvalidQuery";
        case Errc::InvalidEncoding:   return "InvalidEncoding";
    }
    return "Unknown";
}

const std::error_category& error_category() {
    static ErrorCategoryImpl category;
    return category;
}

std::string Error::message() const {
    std::string result = error_category().message(static_cast<int>(code));
    if (!detail.empty()) {
        result += ": ";
        result += detail;
    }
    return result;
}

} // namespace surl::core
