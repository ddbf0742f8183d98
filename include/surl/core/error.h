#pragma once
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace surl::core {

enum class Errc {
    InvalidLabel = 1,
    InvalidHost,
    UnsupportedScheme,
    MissingScheme,
    InvalidPort,
    InvalidPath,
    InvalidQuery,
    InvalidEncoding,
};

const char* errc_name(Errc code);

const std::error_category& error_category();

inline std::error_code make_error_code(Errc code) noexcept {
    return {static_cast<int>(code), error_category()};
}

struct Error {
    Errc code = Errc::InvalidEncoding;
    std::string detail;

    std::string message() const;
    std::error_code error_code() const { return make_error_code(code); }
};

// Either a value or the Error that prevented producing one.
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const { return ok(); }

    T& value() & {
        check_value();
        return std::get<T>(storage_);
    }
    const T& value() const& {
        check_value();
        return std::get<T>(storage_);
    }
    T&& value() && {
        check_value();
        return std::get<T>(std::move(storage_));
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("surl::core::Result: error() called on a value");
        }
        return std::get<Error>(storage_);
    }

private:
    void check_value() const {
        if (!ok()) {
            throw std::logic_error("surl::core::Result: value() called on an error: " +
                                   std::get<Error>(storage_).message());
        }
    }

    std::variant<T, Error> storage_;
};

inline Error make_error(Errc code, std::string detail = {}) {
    return Error{code, std::move(detail)};
}

} // namespace surl::core

namespace std {
template <>
struct is_error_code_enum<surl::core::Errc> : true_type {};
} // namespace std
