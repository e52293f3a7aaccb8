#pragma once

/// @file result.hpp
/// @brief Result<T, E>: a success value or an error, never both.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace otpm {

/// Outcome of a fallible operation.
///
/// Token operations return Result instead of throwing, so a rejected request
/// never leaves a half-written record behind. Accessing the wrong alternative
/// is undefined behavior; check hasValue()/hasError() first.
///
/// Example:
/// @code
///   auto key = KeyCodec::decodeBase32("JBSWY3DPEHPK3PXP");
///   if (!key) {
///       report(key.error().message());
///       return;
///   }
///   use(std::move(key).value());
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Operations that only succeed or fail.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const E& error() const& { return *error_; }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace otpm
