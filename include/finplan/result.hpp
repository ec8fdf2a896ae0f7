#pragma once

/// @file include/finplan/result.hpp
/// @brief Value-or-error return types used at every fallible public entry.
///
/// `Result<T>` carries either a value or a human-readable error message;
/// `Status` is the value-less form. Neither throws on construction, and the
/// library never reports failure through exceptions.

#include <string>
#include <utility>
#include <variant>

namespace finplan {

/// Human-readable failure description.
struct Error {
    std::string message;
};

template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
    Result(Error error) : state_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] static Result failure(std::string message) {
        return Result(Error{std::move(message)});
    }

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(state_);
    }
    explicit operator bool() const noexcept { return has_value(); }

    /// Precondition: `has_value()`.
    [[nodiscard]] const T& value() const& { return std::get<T>(state_); }
    [[nodiscard]] T& value() & { return std::get<T>(state_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(state_)); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &std::get<T>(state_); }
    T* operator->() { return &std::get<T>(state_); }

    /// Precondition: `!has_value()`.
    [[nodiscard]] const std::string& error() const {
        return std::get<Error>(state_).message;
    }

private:
    std::variant<T, Error> state_;
};

/// Success, or failure with a reason.
class Status {
public:
    [[nodiscard]] static Status success() { return Status{}; }
    [[nodiscard]] static Status failure(std::string reason) {
        Status s;
        s.ok_ = false;
        s.reason_ = std::move(reason);
        return s;
    }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    explicit operator bool() const noexcept { return ok_; }

    /// Empty when `ok()`.
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    bool        ok_ = true;
    std::string reason_;
};

}  // namespace finplan
