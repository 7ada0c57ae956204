/**
 * @file persistence.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief The interface the owning collection talks to.
 */

#pragma once
#include <functional> // `std::function`
#include <memory>     // `std::unique_ptr`

#include "upersist/cpp/operations.hpp"

namespace unum::upersist {

using done_callback_t = std::function<void(status_t)>;

/**
 * @brief Keeps the in-memory collection and its durable mirror in sync.
 *
 * The collection calls `load_database` once at startup, `persist_new_state`
 * after every mutation, and `persist_cached_database` to compact the store.
 * Each operation also has a callback flavour, invoking the callback
 * exactly once, before returning.
 *
 * ## Class Specs
 * - Concurrency: Single-threaded. Write transactions of different objects
 *   sharing an engine are serialized by the engine itself.
 * - Lifetime: Must not outlive the collection. Closes the database on destruction.
 * - Copyable: No.
 * - Exceptions: Never, unless the collection throws.
 */
class persistence_t {
    config_t config_;
    collection_t& collection_;
    engine_ptr_t engine_;
    store_connector_t connector_;
    transaction_runner_t runner_;
    compactor_t compactor_;
    incremental_persister_t persister_;
    loader_t loader_;

  public:
    /**
     * @param engine May be empty only if `config.in_memory_only` is set.
     */
    persistence_t(config_t config, collection_t& collection, engine_ptr_t engine);
    persistence_t(persistence_t const&) = delete;
    persistence_t& operator=(persistence_t const&) = delete;

    /**
     * @brief Instantiates the engine described by the config and binds it to @p collection.
     */
    static expected_gt<std::unique_ptr<persistence_t>> make(config_t config, collection_t& collection);

    status_t load_database();
    void load_database(done_callback_t const& callback);

    status_t persist_new_state(documents_t const& delta);
    void persist_new_state(documents_t const& delta, done_callback_t const& callback);

    status_t persist_cached_database();
    void persist_cached_database(done_callback_t const& callback);

    config_t const& config() const noexcept { return config_; }
    engine_ptr_t const& engine() const noexcept { return engine_; }
    store_connector_t& connector() noexcept { return connector_; }
    transaction_runner_t& runner() noexcept { return runner_; }

    compactor_t const& compactor() const noexcept { return compactor_; }
    incremental_persister_t const& persister() const noexcept { return persister_; }
    loader_t const& loader() const noexcept { return loader_; }
};

} // namespace unum::upersist
