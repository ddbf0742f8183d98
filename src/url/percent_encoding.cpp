#include <surl/url/percent_encoding.h>
#include <cstddef>

namespace surl::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_sub_delim(char c) {
    return c == '!' || c == '$' || c == '&' || c == '\'' ||
           c == '(' || c == ')' || c == '*' || c == '+' ||
           c == ',' || c == ';' || c == '=';
}

bool is_safe(char c, EncodeSet set) {
    if (is_unreserved(c)) return true;

    switch (set) {
        case EncodeSet::PathSegment:
            return is_sub_delim(c) || c == ':' || c == '@';
        case EncodeSet::Query:
            if (c == '&' || c == '=' || c == '+') return false;
            return is_sub_delim(c) || c == ':' || c == '@' || c == '/' || c == '?';
        case EncodeSet::Fragment:
            return is_sub_delim(c) || c == ':' || c == '@' || c == '/' || c == '?';
    }
    return false;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // anonymous namespace

std::string percent_encode(std::string_view input, EncodeSet set) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (is_safe(static_cast<char>(c), set)) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        }
    }

    return result;
}

core::Result<std::string> percent_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            result += input[i];
            continue;
        }
        if (i + 2 >= input.size()) {
            return core::make_error(core::Errc::InvalidEncoding,
                                    "truncated escape at offset " + std::to_string(i));
        }
        int hi = hex_value(input[i + 1]);
        int lo = hex_value(input[i + 2]);
        if (hi < 0 || lo < 0) {
            return core::make_error(core::Errc::InvalidEncoding,
                                    "'" + std::string(input.substr(i, 3)) +
                                        "' is not a valid escape");
        }
        result += static_cast<char>((hi << 4) | lo);
        i += 2;
    }

    return result;
}

core::Result<std::string> percent_decode(std::string_view input, EncodeSet set) {
    auto decoded = percent_decode(input);
    if (!decoded) {
        return core::make_error(decoded.error().code,
                                std::string(encode_set_name(set)) + " " + decoded.error().detail);
    }
    return decoded;
}

const char* encode_set_name(EncodeSet set) {
    switch (set) {
        case EncodeSet::PathSegment: return "path segment";
        case EncodeSet::Query:       return "query";
        case EncodeSet::Fragment:    return "fragment";
    }
    return "component";
}

} // namespace surl::url
