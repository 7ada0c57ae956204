/**
 * @file log.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Leveled logging with a replaceable sink, formatted with `fmt`.
 */

#pragma once
#include <functional> // `std::function`
#include <string>     // `std::string`
#include <utility>    // `std::forward`

#include <fmt/format.h> // `fmt::format`

namespace unum::upersist {

enum class log_level_t { debug_k = 0, info_k, warning_k, error_k, off_k };

using log_sink_t = std::function<void(log_level_t, std::string const&)>;

char const* log_level_name(log_level_t level) noexcept;

/**
 * @brief Replaces the process-wide sink. An empty function restores
 * the default one, printing to `stderr`.
 */
void set_log_sink(log_sink_t sink);
void set_log_level(log_level_t level) noexcept;
log_level_t log_level() noexcept;

void log_message(log_level_t level, std::string const& message);

template <typename... args_at>
void log_format(log_level_t level, fmt::format_string<args_at...> format, args_at&&... args) {
    if (level < log_level())
        return;
    log_message(level, fmt::format(format, std::forward<args_at>(args)...));
}

} // namespace unum::upersist

#define log_debug_m(...) ::unum::upersist::log_format(::unum::upersist::log_level_t::debug_k, __VA_ARGS__)
#define log_info_m(...) ::unum::upersist::log_format(::unum::upersist::log_level_t::info_k, __VA_ARGS__)
#define log_warning_m(...) ::unum::upersist::log_format(::unum::upersist::log_level_t::warning_k, __VA_ARGS__)
#define log_error_m(...) ::unum::upersist::log_format(::unum::upersist::log_level_t::error_k, __VA_ARGS__)
