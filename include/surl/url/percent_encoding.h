#pragma once
#include <surl/core/error.h>
#include <string>
#include <string_view>

namespace surl::url {

// Which URL component a value is encoded for. All sets keep the RFC 3986
// unreserved characters; they differ in which delimiters must be escaped.
enum class EncodeSet {
    PathSegment, // escapes '/', '?', '#'
    Query,       // escapes '&', '=', '+', '#'
    Fragment,    // escapes '#'
};

// Escapes every byte outside `set` as %XX with uppercase hex digits.
std::string percent_encode(std::string_view input, EncodeSet set);

// Reverses percent_encode for any set. Fails with InvalidEncoding when a '%'
// is not followed by two hex digits. '+' is left as '+'. Decoded bytes are
// not checked for UTF-8 validity.
core::Result<std::string> percent_decode(std::string_view input);

// Same result for every set; `set` names the component in error details.
core::Result<std::string> percent_decode(std::string_view input, EncodeSet set);

const char* encode_set_name(EncodeSet set);

} // namespace surl::url
