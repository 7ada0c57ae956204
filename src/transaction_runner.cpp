/**
 * @file transaction_runner.cpp
 */

#include "upersist/cpp/transaction_runner.hpp"

namespace unum::upersist {

expected_gt<transaction_scope_t> transaction_runner_t::open_transaction(txn_mode_t mode) {

    auto maybe_db = connector_.ensure_store();
    if (!maybe_db)
        return maybe_db.release_status();

    transaction_scope_t scope;
    scope.database = *std::move(maybe_db);
    auto maybe_txn = scope.database->begin_transaction(connector_.store(), mode);
    if (!maybe_txn) {
        auto status = maybe_txn.release_status();
        status.recode(error_code_t::connection_k);
        return std::move(status);
    }

    scope.transaction = *std::move(maybe_txn);
    return std::move(scope);
}

} // namespace unum::upersist
