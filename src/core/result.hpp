#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace relayscout {

/**
 * ErrorKind - coarse classification of a failure.
 *
 * Lets callers tell "nothing was found" apart from "discovery could not
 * even be attempted" without matching on message text.
 */
enum class ErrorKind {
    Generic,
    Transport,          // socket bind, multicast join, adapter enable
    NotSupported,       // no BLE/WiFi scanner on this platform
    SsidNotFound,
    AuthFailed,
    ToolNotFound,       // no OS network tool available
    ConnectionTimeout,
    Cancelled,
    Probe,              // HTTP probe of a device failed
    InvalidArgument,
};

/**
 * Error - failure description carried by Result.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Generic};
    std::optional<ErrorKind> cause_kind;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Generic)
        : message(std::move(msg)), kind(k) {}

    /**
     * Wrap an underlying error with context. The message becomes
     * "message: cause.message"; the cause's kind is kept in cause_kind.
     */
    [[nodiscard]] static Error wrap(ErrorKind k, const std::string& msg, const Error& cause) {
        Error e{msg + ": " + cause.message, k};
        e.cause_kind = cause.kind;
        return e;
    }

    /**
     * True when this error or the error it wraps has the given kind.
     */
    [[nodiscard]] bool is(ErrorKind k) const noexcept {
        return kind == k || (cause_kind && *cause_kind == k);
    }

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind;
    }
};

/**
 * Result<T, E> - either a value or an error.
 *
 *   Result<int> parse_port(const QString& s) {
 *       bool ok = false;
 *       const int v = s.toInt(&ok);
 *       if (!ok) return Result<int>::err(Error{"bad port", ErrorKind::InvalidArgument});
 *       return Result<int>::ok(v);
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Access the value. Throws std::runtime_error when holding an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(std::nullopt); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

    void unwrap() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_->message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return *error_;
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

template<typename T>
using Res = Result<T, Error>;

} // namespace relayscout
