/**
 * @file loader.cpp
 *
 * @brief Rebuilds the in-memory collection from the durable store.
 */

#include "upersist/cpp/operations.hpp"
#include "upersist/cpp/log.hpp"

namespace unum::upersist {

status_t loader_t::run() {

    // Operations, queued before the load completes, must see an empty collection
    collection_.reset_indexes();

    if (config_.in_memory_only) {
        transition(stage_t::done_k);
        collection_.executor().process_buffer();
        return {};
    }

    // A write transaction, so that it serializes with the writers
    transition(stage_t::opening_k);
    auto maybe_scope = runner_.open_write_transaction();
    if (!maybe_scope)
        return fail(maybe_scope.release_status());
    transaction_scope_t scope = *std::move(maybe_scope);

    transition(stage_t::scanning_k);
    documents_t records;
    {
        auto maybe_cursor = scope->open_cursor();
        if (!maybe_cursor)
            return fail(std::move(maybe_cursor.release_status().recode(error_code_t::transaction_k)));
        cursor_ptr_t cursor = *std::move(maybe_cursor);
        while (cursor->valid()) {
            auto maybe_doc = cursor->document();
            if (!maybe_doc)
                return fail(std::move(maybe_doc.release_status().recode(error_code_t::transaction_k)));
            records.push_back(*std::move(maybe_doc));

            auto status = cursor->next();
            if (!status)
                return fail(std::move(status.recode(error_code_t::transaction_k)));
        }
    }

    auto status = scope->commit();
    if (!status)
        return fail(std::move(status.recode(error_code_t::transaction_k)));

    log_debug_m("Loaded {} records from `{}`", records.size(), config_.store);
    collection_.reset_indexes(std::move(records));
    collection_.executor().process_buffer();
    transition(stage_t::done_k);
    return {};
}

} // namespace unum::upersist
