#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace lanscout {

/**
 * ErrorKind - Failure taxonomy for discovery.
 *
 * Transport:     socket bind/join/receive failure.
 * Decode:        malformed announcement payload (never leaves the receiver).
 * Configuration: the environment prevents a backend from running
 *                (port in use, mDNS unavailable).
 */
enum class ErrorKind {
    Transport,
    Decode,
    Configuration,
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * Error - A failure with a kind, a message and an optional numeric code.
 */
struct Error {
    ErrorKind kind{ErrorKind::Transport};
    std::string message;
    int code{0};

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    [[nodiscard]] static Error transport(std::string msg, int c = 0) {
        return Error{ErrorKind::Transport, std::move(msg), c};
    }
    [[nodiscard]] static Error decode(std::string msg) {
        return Error{ErrorKind::Decode, std::move(msg)};
    }
    [[nodiscard]] static Error configuration(std::string msg, int c = 0) {
        return Error{ErrorKind::Configuration, std::move(msg), c};
    }

    bool operator==(const Error& other) const = default;
};

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 *   auto rec = decode_announcement(bytes);
 *   if (rec.is_err()) return;
 *   use(rec.unwrap());
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Access the value. Throws std::logic_error when called on an error.
     */
    [[nodiscard]] T& unwrap() & {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        check_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::logic_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
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

    void check_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::logic_error("Result::unwrap() called on error: " +
                                   std::get<1>(data_).message);
        } else {
            throw std::logic_error("Result::unwrap() called on error");
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok_) {
            throw std::logic_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

using VoidResult = Result<void, Error>;

} // namespace lanscout
