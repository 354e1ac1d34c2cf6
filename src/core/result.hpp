#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace larder {

/**
 * ErrorKind - Failure taxonomy shared by the store, the queue and the
 * sync pipeline. The sync manager decides retry/surface behaviour from it.
 */
enum class ErrorKind {
    Storage,
    NotFound,
    InvalidArgument,
    NetworkError,
    ServerRejection,
    VersionConflict,
    StorageQuotaExceeded,
    TerminalSyncFailure,
    Corrupted
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Storage: return "storage";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::NetworkError: return "network_error";
        case ErrorKind::ServerRejection: return "server_rejection";
        case ErrorKind::VersionConflict: return "version_conflict";
        case ErrorKind::StorageQuotaExceeded: return "storage_quota_exceeded";
        case ErrorKind::TerminalSyncFailure: return "terminal_sync_failure";
        case ErrorKind::Corrupted: return "corrupted";
    }
    return "unknown";
}

/**
 * Transient failures are retried with backoff and stay invisible to the
 * caller until the retry ceiling is reached.
 */
[[nodiscard]] constexpr bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::NetworkError || kind == ErrorKind::ServerRejection;
}

/**
 * Error type for Result - a message, an optional numeric code (SQLite result
 * code or HTTP status) and the failure kind.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Storage};

    Error() = default;
    explicit Error(std::string msg, int c = 0, ErrorKind k = ErrorKind::Storage)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error of(ErrorKind k, std::string msg, int c = 0) {
        return Error{std::move(msg), c, k};
    }

    [[nodiscard]] bool retryable() const noexcept { return is_retryable(kind); }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - value-or-error return type used by every fallible call.
 *
 * Usage:
 *   Result<Record> load(const std::string& id) {
 *       if (id.empty()) return Result<Record>::err(Error::of(ErrorKind::InvalidArgument, "empty id"));
 *       ...
 *   }
 *
 *   auto qty = load(id).map([](const Record& r) { return r.fields.size(); });
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
     * Tests use it freely; library code checks is_err() first.
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
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

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
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    /**
     * Run a side effect on the error (typically logging) and pass the
     * Result through unchanged.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (!is_err()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so T and E may be the same type.
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

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

/**
 * Forward the error of `r` as a Result of another value type.
 */
template<typename T, typename U>
[[nodiscard]] Result<T, Error> forward_err(const Result<U, Error>& r) {
    return Result<T, Error>::err(r.unwrap_err());
}

} // namespace larder
