#pragma once

#include "core/types.hpp"

#include <variant>
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace waypool {

/**
 * ErrorCode - Typed failure taxonomy shared by every core operation.
 *
 * Everything except Internal is an expected business outcome that callers
 * surface directly. Internal means the store or a primitive failed.
 */
enum class ErrorCode {
    Internal,
    NotFound,
    Forbidden,
    InvalidArgument,
    InvalidState,
    InsufficientSeats,
    PaymentFailed,
    InvalidCredentialFormat,
    CredentialExpired,
    CredentialLocked,
    CredentialMismatch
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal: return "internal";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::InsufficientSeats: return "insufficient_seats";
        case ErrorCode::PaymentFailed: return "payment_failed";
        case ErrorCode::InvalidCredentialFormat: return "invalid_credential_format";
        case ErrorCode::CredentialExpired: return "credential_expired";
        case ErrorCode::CredentialLocked: return "credential_locked";
        case ErrorCode::CredentialMismatch: return "credential_mismatch";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure with a message, a code and the
 * details a caller needs to act on it.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Internal};

    // CredentialMismatch: attempts left before lockout.
    std::optional<int> attempts_remaining;
    // InsufficientSeats: seats available when the check failed.
    std::optional<int> seats_available;
    // CredentialLocked: when verification reopens.
    std::optional<Timestamp> retry_after;

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Internal)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] bool is_business() const noexcept {
        return code != ErrorCode::Internal;
    }

    [[nodiscard]] static Error insufficient_seats(int available) {
        Error e{"Not enough available seats (" + std::to_string(available) + " available)",
                ErrorCode::InsufficientSeats};
        e.seats_available = available;
        return e;
    }

    [[nodiscard]] static Error credential_mismatch(int remaining) {
        Error e{"Invalid PIN", ErrorCode::CredentialMismatch};
        e.attempts_remaining = remaining;
        return e;
    }

    [[nodiscard]] static Error credential_locked(Timestamp until) {
        Error e{"Too many failed attempts", ErrorCode::CredentialLocked};
        e.retry_after = until;
        return e;
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<int> seats(const Ride& ride) {
 *       if (ride.total_seats < 1) return Result<int>::err(Error{"no seats", ErrorCode::InvalidState});
 *       return Result<int>::ok(ride.available_seats);
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
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

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    // Indexed so that T == E (e.g. Result<std::string, std::string>) stays usable.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
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

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

} // namespace waypool
