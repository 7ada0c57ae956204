/**
 * @file store_connector.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Lazily opens a database and makes sure the target store exists in it.
 */

#pragma once
#include <cstddef> // `std::size_t`
#include <string>  // `std::string`

#include "upersist/cpp/engine.hpp"

namespace unum::upersist {

/**
 * @brief Owns the database handle of one persistence object.
 *
 * The handle is opened on first use and reused afterwards. If the store
 * is missing, the database is reopened one version higher, and the store
 * is created from the upgrade callback, keyed by the identifier field.
 * The number of reopenings is bounded by `max_upgrade_attempts`.
 *
 * ## Class Specs
 * - Concurrency: Single-threaded.
 * - Lifetime: Closes the handle on destruction or on a version change notification.
 * - Copyable: No.
 * - Exceptions: Never.
 */
class store_connector_t {
    engine_ptr_t engine_;
    std::string database_;
    std::string store_;
    std::string key_field_;
    std::size_t max_upgrade_attempts_;

    database_ptr_t handle_;
    std::size_t upgrades_ = 0;

  public:
    store_connector_t(engine_ptr_t engine,
                      std::string database,
                      std::string store,
                      std::string key_field,
                      std::size_t max_upgrade_attempts) noexcept;
    store_connector_t(store_connector_t const&) = delete;
    store_connector_t& operator=(store_connector_t const&) = delete;
    ~store_connector_t() noexcept;

    /**
     * @brief Returns an open handle, containing the store.
     * @return Handle or a `connection_k` error.
     */
    expected_gt<database_ptr_t> ensure_store();

    /** @brief Closes and forgets the cached handle. The next call reopens it. */
    void release() noexcept;

    bool is_connected() const noexcept { return handle_ && handle_->is_open(); }

    /** @brief Number of schema upgrades, this connector has triggered. */
    std::size_t upgrades() const noexcept { return upgrades_; }

    std::string const& database() const noexcept { return database_; }
    std::string const& store() const noexcept { return store_; }
};

} // namespace unum::upersist
