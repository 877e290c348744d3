#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace memconcept {

/// Error type for memory operations
struct Error {
    enum class Code {
        Success,
        OutOfRange,        ///< Offset, position or dimension outside the valid range
        InvalidArgument,   ///< Size that does not fit, unknown seek origin, over-advance
        TypeMismatch,      ///< Backing storage holds a different element type
        ObjectDisposed,    ///< Operation on a disposed stream
        NotSupported,      ///< Operation the backing cannot perform
        EndOfStream,       ///< Write past the end of a fixed-capacity backing
        Cancelled,         ///< Asynchronous operation cancelled before start
        OutOfMemory        ///< Allocation failure while growing a buffer
    };

    Code code;
    std::string message;

    Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return code != Code::Success;
    }

    [[nodiscard]] static constexpr std::string_view code_name(Code c) noexcept {
        switch (c) {
            case Code::Success:         return "Success";
            case Code::OutOfRange:      return "OutOfRange";
            case Code::InvalidArgument: return "InvalidArgument";
            case Code::TypeMismatch:    return "TypeMismatch";
            case Code::ObjectDisposed:  return "ObjectDisposed";
            case Code::NotSupported:    return "NotSupported";
            case Code::EndOfStream:     return "EndOfStream";
            case Code::Cancelled:       return "Cancelled";
            case Code::OutOfMemory:     return "OutOfMemory";
        }
        return "Unknown";
    }
};

/// Render an error as "Code: message"
[[nodiscard]] inline std::string to_string(const Error& error) {
    if (error.message.empty()) {
        return std::string(Error::code_name(error.code));
    }
    return fmt::format("{}: {}", Error::code_name(error.code), error.message);
}

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::in_place_index<0>, std::move(value)) {}

    Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(std::in_place_index<0>, value) {}

    Result(Error&& error) noexcept
        : data_(std::in_place_index<1>, std::move(error)) {}

    Result(const Error& error) noexcept
        : data_(std::in_place_index<1>, error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return data_.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & noexcept {
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& value() const& noexcept {
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && noexcept {
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<1>(data_);
    }

    template <typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] T value_or(U&& default_value) && {
        if (is_ok()) {
            return std::move(value());
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    /// Chain an operation returning another Result
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> decltype(func(std::declval<const T&>())) {
        using RetType = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return func(value());
        }
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& func) && -> decltype(func(std::declval<T&&>())) {
        using RetType = decltype(func(std::declval<T&&>()));
        if (is_ok()) {
            return func(std::move(value()));
        }
        return RetType{error()};
    }

    /// Map the contained value, forwarding errors unchanged
    template <typename F>
    [[nodiscard]] auto transform(F&& func) const& {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>{func(value())};
        }
        return Result<U>{error()};
    }
};

template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() noexcept : data_(std::monostate{}) {}

    Result(Error&& error) noexcept
        : data_(std::move(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return data_.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<1>(data_);
    }
};

template <typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

/// Err with a {fmt} formatted message
template <typename... Args>
[[nodiscard]] Error Err(Error::Code code, fmt::format_string<Args...> format, Args&&... args) {
    return Error{code, fmt::format(format, std::forward<Args>(args)...)};
}

} // namespace memconcept
