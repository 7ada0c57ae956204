/**
 * @file incremental_persister.cpp
 *
 * @brief Applies a delta of inserts, updates and deletions in one transaction.
 */

#include <fmt/format.h>

#include "upersist/cpp/operations.hpp"
#include "upersist/cpp/log.hpp"

namespace unum::upersist {

status_t incremental_persister_t::run(documents_t const& delta) {

    if (config_.in_memory_only) {
        transition(stage_t::done_k);
        return {};
    }

    transition(stage_t::opening_k);
    auto maybe_scope = runner_.open_write_transaction();
    if (!maybe_scope)
        return fail(maybe_scope.release_status());
    transaction_scope_t scope = *std::move(maybe_scope);

    transition(stage_t::writing_k);
    status_t first_error;
    std::size_t skipped_markers = 0;
    for (auto const& doc : delta) {
        status_t status;
        if (is_tombstone(doc)) {
            document_t id = document_id(doc, config_.key_field);
            status = id.is_null() //
                         ? status_t {error_code_t::delete_k,
                                     fmt::format("Tombstone without a valid `{}` field", config_.key_field)}
                         : scope->remove(encode_key(id));
            status.recode(error_code_t::delete_k);
        }
        else if (is_metadata_marker(doc)) {
            // Index definitions aren't persisted yet
            ++skipped_markers;
            continue;
        }
        else {
            status = scope->put(doc);
            status.recode(error_code_t::write_k);
        }

        if (!status && !tolerate(config_.incremental_policy, std::move(status), first_error))
            break;
    }

    auto status = scope->commit();
    if (!first_error) {
        if (!status)
            log_error_m("Persisting `{}` couldn't commit partial results: {}", config_.store, status.to_string());
        return fail(std::move(first_error));
    }
    if (!status)
        return fail(std::move(status.recode(error_code_t::transaction_k)));

    log_debug_m("Persisted {} changes into `{}`, skipped {} index markers",
                delta.size() - skipped_markers,
                config_.store,
                skipped_markers);
    transition(stage_t::done_k);
    return {};
}

} // namespace unum::upersist
