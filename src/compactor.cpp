/**
 * @file compactor.cpp
 *
 * @brief Full compaction: makes the store an exact mirror of the in-memory snapshot.
 */

#include <unordered_set>

#include "upersist/cpp/operations.hpp"
#include "upersist/cpp/log.hpp"

namespace unum::upersist {

status_t compactor_t::run() {

    if (config_.in_memory_only) {
        transition(stage_t::done_k);
        return {};
    }

    // The snapshot is taken before any I/O, later mutations go through the incremental path
    documents_t objects = collection_.all_data();

    transition(stage_t::opening_k);
    auto maybe_scope = runner_.open_write_transaction();
    if (!maybe_scope)
        return fail(maybe_scope.release_status());
    transaction_scope_t scope = *std::move(maybe_scope);

    // 1. Collect every key, currently present in the store
    transition(stage_t::scanning_k);
    std::unordered_set<doc_key_t> keys_to_delete;
    {
        auto maybe_cursor = scope->open_cursor();
        if (!maybe_cursor)
            return fail(std::move(maybe_cursor.release_status().recode(error_code_t::transaction_k)));
        cursor_ptr_t cursor = *std::move(maybe_cursor);
        while (cursor->valid()) {
            keys_to_delete.insert(cursor->key());
            auto status = cursor->next();
            if (!status)
                return fail(std::move(status.recode(error_code_t::transaction_k)));
        }
    }

    // 2. Upsert the snapshot, one document at a time
    transition(stage_t::writing_k);
    status_t first_error;
    std::size_t skipped_markers = 0;
    for (auto const& doc : objects) {
        if (is_metadata_marker(doc)) {
            ++skipped_markers;
            continue;
        }
        // A failed upsert keeps the previous durable version instead of deleting it
        keys_to_delete.erase(encode_key(document_id(doc, config_.key_field)));
        auto status = scope->put(doc);
        if (status)
            continue;
        if (!tolerate(config_.compaction_policy, std::move(status.recode(error_code_t::write_k)), first_error))
            break;
    }

    // 3. Drop the keys, that weren't upserted in this run
    if (first_error) {
        transition(stage_t::deleting_k);
        for (auto const& key : keys_to_delete) {
            auto status = scope->remove(key);
            if (status)
                continue;
            if (!tolerate(config_.compaction_policy, std::move(status.recode(error_code_t::delete_k)), first_error))
                break;
        }
    }

    // Applied operations are committed even after a record error, nothing is rolled back
    auto status = scope->commit();
    if (!first_error) {
        if (!status)
            log_error_m("Compaction of `{}` couldn't commit partial results: {}", config_.store, status.to_string());
        return fail(std::move(first_error));
    }
    if (!status)
        return fail(std::move(status.recode(error_code_t::transaction_k)));

    log_debug_m("Compacted `{}` to {} records, dropped {}",
                config_.store,
                objects.size() - skipped_markers,
                keys_to_delete.size());
    transition(stage_t::done_k);
    return {};
}

} // namespace unum::upersist
