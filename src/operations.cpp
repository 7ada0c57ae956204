/**
 * @file operations.cpp
 *
 * @brief Stage bookkeeping and record error policy, shared by all operations.
 */

#include "upersist/cpp/operations.hpp"
#include "upersist/cpp/log.hpp"

namespace unum::upersist {

char const* stage_name(stage_t stage) noexcept {
    switch (stage) {
    case stage_t::opening_k: return "opening";
    case stage_t::scanning_k: return "scanning";
    case stage_t::writing_k: return "writing";
    case stage_t::deleting_k: return "deleting";
    case stage_t::done_k: return "done";
    default: return "failed";
    }
}

void operation_base_t::transition(stage_t stage) {
    log_debug_m("{} of `{}`: {} -> {}", name_, config_.store, stage_name(stage_), stage_name(stage));
    stage_ = stage;
}

status_t operation_base_t::fail(status_t status) {
    transition(stage_t::failed_k);
    log_error_m("{} of `{}` failed: {}", name_, config_.store, status.to_string());
    return status;
}

bool operation_base_t::tolerate(record_error_policy_t policy, status_t status, status_t& first_error) {
    if (policy == record_error_policy_t::continue_k) {
        log_warning_m("{} of `{}` skipped a record: {}", name_, config_.store, status.to_string());
        return true;
    }
    first_error = std::move(status);
    return false;
}

} // namespace unum::upersist
