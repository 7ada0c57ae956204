/**
 * @file log.cpp
 *
 * @brief Default `stderr` sink and the process-wide logging state.
 */

#include <atomic> // `std::atomic`
#include <mutex>  // `std::mutex`

#include <fmt/core.h> // `fmt::print`

#include "upersist/cpp/log.hpp"

namespace unum::upersist {

namespace {

std::atomic<log_level_t> min_level_ {log_level_t::warning_k};
std::mutex sink_mutex_;
log_sink_t sink_;

} // namespace

char const* log_level_name(log_level_t level) noexcept {
    switch (level) {
    case log_level_t::debug_k: return "debug";
    case log_level_t::info_k: return "info";
    case log_level_t::warning_k: return "warning";
    case log_level_t::error_k: return "error";
    default: return "off";
    }
}

void set_log_sink(log_sink_t sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void set_log_level(log_level_t level) noexcept { min_level_.store(level); }

log_level_t log_level() noexcept { return min_level_.load(); }

void log_message(log_level_t level, std::string const& message) {
    if (level < log_level() || level == log_level_t::off_k)
        return;

    // Sinks are called outside of the lock, so they may log themselves
    log_sink_t sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (sink)
        sink(level, message);
    else
        fmt::print(stderr, "[upersist] {}: {}\n", log_level_name(level), message);
}

} // namespace unum::upersist
