/**
 * @file store_connector.cpp
 * @date 17 Oct 2026
 *
 * @brief Lazy connection, bounded schema upgrades and transaction scopes.
 */

#include <limits> // `std::numeric_limits`

#include <gtest/gtest.h>

#include "upersist/upersist.hpp"

#include "instrumented_engine.hpp"

using namespace unum::upersist;
using namespace unum::upersist::test;
using namespace unum;

TEST(connector, lazy_and_idempotent) {
    auto probe = std::make_shared<probe_t>();
    store_connector_t connector(instrument(make_memory_engine(), probe), "db", "docs", "id", 8);
    EXPECT_FALSE(connector.is_connected());
    EXPECT_EQ(probe->counters.opens, 0u);

    auto maybe_db = connector.ensure_store();
    ASSERT_TRUE(maybe_db) << maybe_db.status().to_string();
    EXPECT_TRUE((*maybe_db)->contains_store("docs"));
    EXPECT_EQ((*maybe_db)->version(), 1u);

    auto maybe_same = connector.ensure_store();
    ASSERT_TRUE(maybe_same);
    EXPECT_EQ(*maybe_same, *maybe_db);
    EXPECT_EQ(probe->counters.opens, 1u);
    EXPECT_EQ(connector.upgrades(), 1u);
}

TEST(connector, one_upgrade_per_missing_store) {
    engine_ptr_t engine = make_memory_engine();
    store_connector_t first(engine, "db", "first", "id", 8);
    store_connector_t second(engine, "db", "second", "_id", 8);

    ASSERT_TRUE(first.ensure_store());
    auto maybe_db = second.ensure_store();
    ASSERT_TRUE(maybe_db) << maybe_db.status().to_string();
    EXPECT_EQ((*maybe_db)->version(), 2u);
    EXPECT_EQ(first.upgrades(), 1u);
    EXPECT_EQ(second.upgrades(), 1u);

    // The upgrade of the second one has closed the first one
    EXPECT_FALSE(first.is_connected());
    auto maybe_first = first.ensure_store();
    ASSERT_TRUE(maybe_first);
    EXPECT_EQ((*maybe_first)->version(), 2u);
    EXPECT_EQ(first.upgrades(), 1u);

    // Every store has its own key path
    auto maybe_txn = (*maybe_db)->begin_transaction("second", txn_mode_t::write_k);
    ASSERT_TRUE(maybe_txn);
    EXPECT_TRUE((*maybe_txn)->put({{"_id", "a"}}));
    EXPECT_FALSE((*maybe_txn)->put({{"id", "a"}}));
}

TEST(connector, release_and_reconnect) {
    auto probe = std::make_shared<probe_t>();
    store_connector_t connector(instrument(make_memory_engine(), probe), "db", "docs", "id", 8);
    ASSERT_TRUE(connector.ensure_store());

    connector.release();
    EXPECT_FALSE(connector.is_connected());
    ASSERT_TRUE(connector.ensure_store());
    EXPECT_TRUE(connector.is_connected());
    EXPECT_EQ(probe->counters.opens, 2u);
    EXPECT_EQ(probe->counters.upgrades, 1u);
}

TEST(connector, missing_engine) {
    store_connector_t connector(nullptr, "db", "docs", "id", 8);
    auto maybe_db = connector.ensure_store();
    EXPECT_EQ(maybe_db.status().code(), error_code_t::uninitialized_state_k);

    transaction_runner_t runner(connector);
    EXPECT_EQ(runner.open_write_transaction().status().code(), error_code_t::uninitialized_state_k);
}

TEST(connector, failed_upgrades_are_connection_errors) {
    auto probe = std::make_shared<probe_t>();
    store_connector_t connector(instrument(make_memory_engine(), probe), "db", "", "id", 8);
    auto maybe_db = connector.ensure_store();
    EXPECT_EQ(maybe_db.status().code(), error_code_t::connection_k);
    EXPECT_EQ(probe->counters.opens, 1u);
}

TEST(connector, upgrades_are_capped) {
    auto probe = std::make_shared<probe_t>();
    probe->faults.skip_upgrades = true;
    std::size_t const unbounded = std::numeric_limits<std::size_t>::max();
    store_connector_t connector(instrument(make_memory_engine(), probe), "db", "docs", "id", unbounded);

    auto maybe_db = connector.ensure_store();
    EXPECT_EQ(maybe_db.status().code(), error_code_t::connection_k);
    EXPECT_EQ(probe->counters.upgrades, config_t::max_upgrade_attempts_k);
    EXPECT_EQ(probe->counters.opens, config_t::max_upgrade_attempts_k + 1);
    EXPECT_FALSE(connector.is_connected());
}

TEST(runner, scopes_are_bound_to_the_store) {
    store_connector_t connector(make_memory_engine(), "db", "docs", "id", 8);
    transaction_runner_t runner(connector);

    {
        auto maybe_scope = runner.open_write_transaction();
        ASSERT_TRUE(maybe_scope) << maybe_scope.status().to_string();
        transaction_scope_t scope = *std::move(maybe_scope);
        EXPECT_EQ(scope->store(), "docs");
        EXPECT_EQ(scope->mode(), txn_mode_t::write_k);
        EXPECT_TRUE(scope->put({{"id", "a"}}));
        EXPECT_TRUE(scope->commit());
    }

    auto maybe_scope = runner.open_read_transaction();
    ASSERT_TRUE(maybe_scope);
    transaction_scope_t scope = *std::move(maybe_scope);
    EXPECT_EQ(scope->mode(), txn_mode_t::read_k);
    EXPECT_FALSE(scope->put({{"id", "b"}}));

    auto maybe_cursor = scope->open_cursor();
    ASSERT_TRUE(maybe_cursor);
    EXPECT_TRUE((*maybe_cursor)->valid());
    EXPECT_EQ((*maybe_cursor)->key(), encode_key("a"));
}

TEST(runner, begin_failures_are_connection_errors) {
    auto probe = std::make_shared<probe_t>();
    store_connector_t connector(instrument(make_memory_engine(), probe), "db", "docs", "id", 8);
    transaction_runner_t runner(connector);

    probe->faults.fail_begin = true;
    auto maybe_scope = runner.open_write_transaction();
    EXPECT_EQ(maybe_scope.status().code(), error_code_t::connection_k);
    EXPECT_EQ(probe->counters.begins, 1u);
    EXPECT_EQ(probe->counters.cursors, 0u);
}
