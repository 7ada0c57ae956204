/**
 * @file engine.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Abstract transactional Key-Value engine with named stores and versioned schemas.
 *
 * The persistence layer only relies on the following capabilities:
 * > Databases, identified by name, carrying a monotonic schema version.
 * > Named stores inside a database, each keyed by one field of the documents.
 * > Read and write transactions, scoped to one store.
 * > Ordered forward cursors and per-key put/delete inside a transaction.
 *
 * Two implementations are provided: @b RocksDB for persistent storage
 * and an @b STL-based in-memory one, mostly for testing.
 */

#pragma once
#include <functional> // `std::function`
#include <memory>     // `std::shared_ptr`
#include <optional>   // `std::optional`
#include <string>     // `std::string`
#include <vector>     // `std::vector`

#include "upersist/cpp/types.hpp"
#include "upersist/cpp/status.hpp"

namespace unum::upersist {

struct engine_config_t;

/**
 * @brief Forward-only iterator over the records of a store, in key order.
 * Sees the uncommitted writes of the transaction that opened it.
 */
class cursor_t {
  public:
    virtual ~cursor_t() = default;

    virtual bool valid() const noexcept = 0;
    virtual doc_key_t const& key() const noexcept = 0;
    virtual expected_gt<document_t> document() const = 0;
    virtual status_t next() = 0;
};

using cursor_ptr_t = std::unique_ptr<cursor_t>;

/**
 * @brief A transaction, scoped to a single store.
 *
 * ## Class Specs
 * - Concurrency: Single-threaded.
 * - Lifetime: Rolls back on destruction, unless committed.
 * - Exclusivity: A write transaction fails to commit, if another write
 *   transaction has committed to the same store after this one began.
 */
class transaction_t {
  public:
    virtual ~transaction_t() = default;

    virtual txn_mode_t mode() const noexcept = 0;
    virtual std::string const& store() const noexcept = 0;

    virtual expected_gt<cursor_ptr_t> open_cursor() = 0;

    /** @brief Upserts a document, extracting the key through the key path of the store. */
    virtual status_t put(document_t const& doc) = 0;
    /** @brief Deletes a record by its encoded key. Missing keys aren't an error. */
    virtual status_t remove(doc_key_t const& key) = 0;

    virtual status_t commit() = 0;
    virtual void rollback() noexcept = 0;
};

using transaction_ptr_t = std::unique_ptr<transaction_t>;

/**
 * @brief Handle to an opened database at a specific version.
 */
class database_t {
  public:
    using version_change_callback_t = std::function<void(version_t old_version, version_t new_version)>;

    virtual ~database_t() = default;

    virtual std::string const& name() const noexcept = 0;
    virtual version_t version() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
    virtual bool contains_store(std::string const& store) const = 0;
    virtual std::vector<std::string> store_names() const = 0;

    virtual expected_gt<transaction_ptr_t> begin_transaction(std::string const& store, txn_mode_t mode) = 0;

    /**
     * @brief Fires when another handle wants to upgrade this database.
     * The handle must be closed from the callback, or the upgrade is blocked.
     */
    virtual void on_version_change(version_change_callback_t callback) = 0;
    virtual void close() noexcept = 0;
};

using database_ptr_t = std::shared_ptr<database_t>;

/**
 * @brief Schema mutations, only available from inside an upgrade callback.
 */
class schema_upgrade_t {
  public:
    virtual ~schema_upgrade_t() = default;

    virtual version_t old_version() const noexcept = 0;
    virtual version_t new_version() const noexcept = 0;
    virtual bool contains_store(std::string const& store) const = 0;
    virtual status_t create_store(std::string const& store, std::string const& key_field) = 0;
};

using upgrade_callback_t = std::function<status_t(schema_upgrade_t&)>;

class engine_t {
  public:
    virtual ~engine_t() = default;

    virtual char const* name() const noexcept = 0;

    /**
     * @brief Opens a database, creating it if missing.
     *
     * @param version If empty, the current one is used. A fresh database starts at 1.
     *                If greater than the current one, other open handles get a version
     *                change notification and @p on_upgrade runs before returning.
     * @return Open handle, or a `connection_k` error.
     */
    virtual expected_gt<database_ptr_t> open(std::string const& name,
                                             std::optional<version_t> version,
                                             upgrade_callback_t const& on_upgrade) = 0;
};

using engine_ptr_t = std::shared_ptr<engine_t>;

/**
 * @brief Instantiates the engine named in the config: "rocksdb" or "memory".
 *
 * @param directory Root directory for persistent engines. Ignored by in-memory ones.
 */
expected_gt<engine_ptr_t> make_engine(engine_config_t const& config,
                                      std::string const& directory,
                                      document_format_t format);

engine_ptr_t make_memory_engine(document_format_t format = document_format_t::msgpack_k);
expected_gt<engine_ptr_t> make_rocksdb_engine(engine_config_t const& config,
                                              std::string const& directory,
                                              document_format_t format = document_format_t::msgpack_k);

/**
 * @brief Serializes documents into the binary layout of the engine.
 */
status_t encode_document(document_t const& doc, document_format_t format, std::string& output) noexcept;
expected_gt<document_t> decode_document(char const* begin, std::size_t length, document_format_t format) noexcept;

} // namespace unum::upersist
