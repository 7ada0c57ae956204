/**
 * @file transaction_runner.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Opens transactions scoped to the store of a `store_connector_t`.
 */

#pragma once
#include "upersist/cpp/store_connector.hpp"

namespace unum::upersist {

/**
 * @brief Transaction together with the database handle it was opened on.
 * Members are ordered, so that the transaction is destroyed first.
 */
struct transaction_scope_t {
    database_ptr_t database;
    transaction_ptr_t transaction;

    transaction_t* operator->() const noexcept { return transaction.get(); }
    transaction_t& operator*() const noexcept { return *transaction; }
};

class transaction_runner_t {
    store_connector_t& connector_;

  public:
    explicit transaction_runner_t(store_connector_t& connector) noexcept : connector_(connector) {}

    /**
     * @brief Ensures the store exists and begins a transaction on it.
     * Exclusivity of write transactions is left to the engine.
     * @return Scope or a `connection_k` error.
     */
    expected_gt<transaction_scope_t> open_transaction(txn_mode_t mode);

    expected_gt<transaction_scope_t> open_read_transaction() { return open_transaction(txn_mode_t::read_k); }
    expected_gt<transaction_scope_t> open_write_transaction() { return open_transaction(txn_mode_t::write_k); }
};

} // namespace unum::upersist
