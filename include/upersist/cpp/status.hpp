/**
 * @file status.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Status codes and Monads, used as the error channel of every operation.
 */

#pragma once
#include <new>       // `std::bad_alloc`
#include <optional>  // `std::optional`
#include <stdexcept> // `std::runtime_error`
#include <string>    // `std::string`
#include <utility>   // `std::exchange`

#include <fmt/format.h> // `fmt::format`

namespace unum::upersist {

enum class error_code_t {
    ok_k = 0,
    /** The database or the store can't be opened or upgraded. */
    connection_k,
    /** The engine failed or aborted the whole transaction. */
    transaction_k,
    /** A single record couldn't be written. */
    write_k,
    /** A single record couldn't be deleted. */
    delete_k,
    out_of_memory_k,
    args_wrong_k,
    uninitialized_state_k,
    error_unknown_k,
};

inline char const* error_code_name(error_code_t code) noexcept {
    switch (code) {
    case error_code_t::ok_k: return "Ok";
    case error_code_t::connection_k: return "ConnectionError";
    case error_code_t::transaction_k: return "TransactionError";
    case error_code_t::write_k: return "WriteError";
    case error_code_t::delete_k: return "DeleteError";
    case error_code_t::out_of_memory_k: return "OutOfMemory";
    case error_code_t::args_wrong_k: return "InvalidArgument";
    case error_code_t::uninitialized_state_k: return "Uninitialized";
    default: return "Unknown";
    }
}

/**
 * @brief Outcome of an operation: either success or an error code with
 * a message. Record-level errors also carry the key they failed on.
 *
 * ## Class Specs
 * - Copyable: No, errors must be consumed or explicitly moved.
 * - Exceptions: Never, except for `throw_unhandled`.
 */
class [[nodiscard]] status_t {
    error_code_t code_ = error_code_t::ok_k;
    std::string message_;
    std::string key_;

  public:
    status_t() noexcept = default;
    status_t(error_code_t code, std::string message, std::string key = {}) noexcept
        : code_(code), message_(std::move(message)), key_(std::move(key)) {}

    status_t(status_t const&) = delete;
    status_t& operator=(status_t const&) = delete;

    status_t(status_t&& other) noexcept
        : code_(std::exchange(other.code_, error_code_t::ok_k)), message_(std::move(other.message_)),
          key_(std::move(other.key_)) {}
    status_t& operator=(status_t&& other) noexcept {
        std::swap(code_, other.code_);
        std::swap(message_, other.message_);
        std::swap(key_, other.key_);
        return *this;
    }

    operator bool() const noexcept { return code_ == error_code_t::ok_k; }
    error_code_t code() const noexcept { return code_; }
    std::string const& message() const noexcept { return message_; }
    std::string const& key() const noexcept { return key_; }

    std::string to_string() const {
        if (code_ == error_code_t::ok_k)
            return error_code_name(code_);
        return key_.empty() //
                   ? fmt::format("{}: {}", error_code_name(code_), message_)
                   : fmt::format("{}: {} (key {})", error_code_name(code_), message_, key_);
    }

    std::runtime_error release_exception() {
        std::runtime_error result(to_string());
        code_ = error_code_t::ok_k;
        message_.clear();
        key_.clear();
        return result;
    }

    void throw_unhandled() {
        if (code_ != error_code_t::ok_k)
            throw release_exception();
    }

    /** @brief Re-labels an error, keeping the message and the key. */
    status_t& recode(error_code_t code) noexcept {
        if (code_ != error_code_t::ok_k)
            code_ = code;
        return *this;
    }
};

/**
 * @brief Extends `std::optional` to support a status, describing empty state.
 */
template <typename object_at>
class [[nodiscard]] expected_gt {
  protected:
    status_t status_;
    object_at object_;

  public:
    expected_gt() = default;
    expected_gt(object_at&& object) : object_(std::move(object)) {}
    expected_gt(status_t&& status, object_at&& default_object = object_at {})
        : status_(std::move(status)), object_(std::move(default_object)) {}

    expected_gt(expected_gt&& other) noexcept : status_(std::move(other.status_)), object_(std::move(other.object_)) {}

    expected_gt& operator=(expected_gt&& other) noexcept {
        std::swap(status_, other.status_);
        std::swap(object_, other.object_);
        return *this;
    }

    operator bool() const noexcept { return status_; }
    object_at operator*() && noexcept { return std::move(object_); }
    object_at const& operator*() const& noexcept { return object_; }
    object_at& operator*() & noexcept { return object_; }
    object_at* operator->() noexcept { return &object_; }
    object_at const* operator->() const noexcept { return &object_; }
    operator std::optional<object_at>() && {
        return !status_ ? std::nullopt : std::optional<object_at> {std::move(object_)};
    }

    status_t const& status() const noexcept { return status_; }
    void throw_unhandled() { return status_.throw_unhandled(); }
    status_t release_status() { return std::exchange(status_, status_t {}); }
    object_at& throw_or_ref() & {
        status_.throw_unhandled();
        return object_;
    }
    object_at throw_or_release() && {
        status_.throw_unhandled();
        return std::move(object_);
    }
};

/**
 * @brief Runs a callable, converting the exceptions of third-party
 * libraries into a status, so that nothing escapes the engine boundary.
 */
template <typename dangerous_at>
status_t safe_section(char const* name, dangerous_at&& dangerous) noexcept {
    try {
        return dangerous();
    }
    catch (std::bad_alloc const&) {
        return {error_code_t::out_of_memory_k, name};
    }
    catch (std::exception const& e) {
        return {error_code_t::error_unknown_k, fmt::format("{}: {}", name, e.what())};
    }
    catch (...) {
        return {error_code_t::error_unknown_k, name};
    }
}

} // namespace unum::upersist

#define return_if_error_m(status) \
    if (!(status))                \
        return std::move(status);

#define return_error_if_m(must_be_true, code, message) \
    if (!(must_be_true))                               \
        return ::unum::upersist::status_t { code, message };
