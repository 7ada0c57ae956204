/**
 * @file operations.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Compaction, incremental persistence and loading, each as an explicit state machine.
 *
 * Every operation walks through a subset of the following stages:
 *
 *      opening -> scanning -> writing -> deleting -> done
 *         \__________\__________\__________\______-> failed
 *
 * All the puts and deletes of one run are issued strictly one after another,
 * inside a single write transaction.
 */

#pragma once
#include "upersist/cpp/collection.hpp"
#include "upersist/cpp/config.hpp"
#include "upersist/cpp/transaction_runner.hpp"

namespace unum::upersist {

enum class stage_t { opening_k, scanning_k, writing_k, deleting_k, done_k, failed_k };

char const* stage_name(stage_t stage) noexcept;

/**
 * @brief Shared bookkeeping of the operations: current stage and record error policy.
 */
class operation_base_t {
  protected:
    char const* name_;
    transaction_runner_t& runner_;
    collection_t& collection_;
    config_t const& config_;
    stage_t stage_ = stage_t::done_k;

    operation_base_t(char const* name,
                     transaction_runner_t& runner,
                     collection_t& collection,
                     config_t const& config) noexcept
        : name_(name), runner_(runner), collection_(collection), config_(config) {}

    void transition(stage_t stage);
    status_t fail(status_t status);

    /**
     * @brief Applies the policy to a failed put or delete.
     * @return `true` if the run may go on with the next record.
     */
    bool tolerate(record_error_policy_t policy, status_t status, status_t& first_error);

  public:
    stage_t last_stage() const noexcept { return stage_; }
};

/**
 * @brief Rewrites the whole store to match the in-memory snapshot.
 *
 * Existing keys are collected with a cursor, then every snapshot document
 * is upserted, and finally every key that wasn't upserted is deleted.
 * So after a successful run, durable keys match the snapshot identifiers.
 */
class compactor_t : public operation_base_t {
  public:
    compactor_t(transaction_runner_t& runner, collection_t& collection, config_t const& config) noexcept
        : operation_base_t("Compaction", runner, collection, config) {}

    status_t run();
};

/**
 * @brief Applies the documents, changed since the last persist.
 * Tombstones delete their keys, metadata markers are skipped.
 */
class incremental_persister_t : public operation_base_t {
  public:
    incremental_persister_t(transaction_runner_t& runner, collection_t& collection, config_t const& config) noexcept
        : operation_base_t("Incremental persistence", runner, collection, config) {}

    status_t run(documents_t const& delta);
};

/**
 * @brief Reads every record back and rebuilds the indexes of the collection.
 * Indexes are reset to empty before any I/O, and stay empty if loading fails.
 */
class loader_t : public operation_base_t {
  public:
    loader_t(transaction_runner_t& runner, collection_t& collection, config_t const& config) noexcept
        : operation_base_t("Loading", runner, collection, config) {}

    status_t run();
};

} // namespace unum::upersist
