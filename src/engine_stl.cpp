/**
 * @file engine_stl.cpp
 *
 * @brief Embedded In-Memory transactional store implementation using only @b STL.
 * Databases outlive their handles, but not the engine object itself.
 * This is not the fastest, not the smartest possible solution,
 * but is a good reference design and a convenient testing backend.
 * Deficiencies:
 * > Global Lock on the registry of databases.
 * > Shared mutex per database, guarding its stores and their entries.
 * > Cursors copy the whole store, merged with the pending writes.
 * > Conflicts are detected per store, not per key.
 */

#include <algorithm>    // `std::max`
#include <cstdint>      // `std::int64_t`
#include <map>          // Stores and their entries
#include <memory>       // `std::weak_ptr`
#include <mutex>        // `std::lock_guard`
#include <optional>     // Pending deletions
#include <shared_mutex> // Syncing access to stores
#include <string>
#include <vector>

#include <fmt/format.h>

#include "upersist/cpp/engine.hpp"

/*********************************************************/
/*****************   Structures & Consts  ****************/
/*********************************************************/

using namespace unum::upersist;
using namespace unum;

namespace {

using generation_t = std::int64_t;
using entries_t = std::map<doc_key_t, std::string>;
using pending_writes_t = std::map<doc_key_t, std::optional<std::string>>;

struct stl_store_t {
    std::string key_field;
    entries_t entries;
    /** @brief Incremented on every commit, that changed the store. */
    generation_t generation = 0;
};

class stl_database_t;

struct stl_state_t {
    std::string name;
    version_t version = 0;
    std::map<std::string, stl_store_t> stores;
    /** @brief Guards `stores`, exclusively held by commits and upgrades. */
    std::shared_mutex mutex;
    std::vector<std::weak_ptr<stl_database_t>> handles;
};

using stl_state_ptr_t = std::shared_ptr<stl_state_t>;

/*********************************************************/
/*****************	       Cursors	      ****************/
/*********************************************************/

class stl_cursor_t final : public cursor_t {
    entries_t entries_;
    entries_t::const_iterator it_;
    document_format_t format_;

  public:
    stl_cursor_t(entries_t&& entries, document_format_t format) noexcept
        : entries_(std::move(entries)), it_(entries_.begin()), format_(format) {}

    bool valid() const noexcept override { return it_ != entries_.end(); }
    doc_key_t const& key() const noexcept override { return it_->first; }

    expected_gt<document_t> document() const override {
        auto maybe_doc = decode_document(it_->second.data(), it_->second.size(), format_);
        if (!maybe_doc)
            return status_t {error_code_t::transaction_k, maybe_doc.status().message(), it_->first};
        return maybe_doc;
    }

    status_t next() override {
        return_error_if_m(valid(), error_code_t::transaction_k, "Cursor is exhausted");
        ++it_;
        return {};
    }
};

/*********************************************************/
/*****************	    Transactions	  ****************/
/*********************************************************/

class stl_transaction_t final : public transaction_t {
    stl_state_ptr_t state_;
    std::string store_;
    txn_mode_t mode_;
    document_format_t format_;
    generation_t start_generation_;
    pending_writes_t writes_;
    bool finished_ = false;

    /** @brief Must be called under the `state_->mutex`. */
    stl_store_t& store_ref() const { return state_->stores.at(store_); }

    generation_t current_generation() const {
        std::shared_lock _ {state_->mutex};
        return store_ref().generation;
    }

    status_t validate_write() const {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");
        return_error_if_m(mode_ == txn_mode_t::write_k, error_code_t::transaction_k, "Read-only transaction");
        return {};
    }

  public:
    stl_transaction_t(stl_state_ptr_t state, std::string store, txn_mode_t mode, document_format_t format)
        : state_(std::move(state)), store_(std::move(store)), mode_(mode), format_(format),
          start_generation_(current_generation()) {}

    txn_mode_t mode() const noexcept override { return mode_; }
    std::string const& store() const noexcept override { return store_; }

    expected_gt<cursor_ptr_t> open_cursor() override {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");

        entries_t merged;
        {
            std::shared_lock _ {state_->mutex};
            merged = store_ref().entries;
        }
        for (auto const& [key, value] : writes_) {
            if (value)
                merged[key] = *value;
            else
                merged.erase(key);
        }
        return cursor_ptr_t {new stl_cursor_t(std::move(merged), format_)};
    }

    status_t put(document_t const& doc) override {
        auto status = validate_write();
        return_if_error_m(status);

        std::string key_field;
        {
            std::shared_lock _ {state_->mutex};
            key_field = store_ref().key_field;
        }
        document_t id = document_id(doc, key_field);
        return_error_if_m(!id.is_null(),
                          error_code_t::write_k,
                          fmt::format("Missing or invalid identifier field `{}`", key_field));

        doc_key_t key = encode_key(id);
        std::string value;
        status = encode_document(doc, format_, value);
        if (!status)
            return {error_code_t::write_k, status.message(), key};

        writes_[key] = std::move(value);
        return {};
    }

    status_t remove(doc_key_t const& key) override {
        auto status = validate_write();
        if (!status)
            return {error_code_t::delete_k, status.message(), key};
        writes_[key] = std::nullopt;
        return {};
    }

    status_t commit() override {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");
        finished_ = true;
        if (writes_.empty())
            return {};

        std::unique_lock _ {state_->mutex};
        stl_store_t& store = store_ref();
        return_error_if_m(store.generation == start_generation_,
                          error_code_t::transaction_k,
                          fmt::format("Store `{}` was modified by a concurrent transaction", store_));

        for (auto& [key, value] : writes_) {
            if (value)
                store.entries[key] = std::move(*value);
            else
                store.entries.erase(key);
        }
        writes_.clear();
        ++store.generation;
        return {};
    }

    void rollback() noexcept override {
        writes_.clear();
        finished_ = true;
    }
};

/*********************************************************/
/*****************	      Databases	      ****************/
/*********************************************************/

class stl_database_t final : public database_t {
    stl_state_ptr_t state_;
    version_t version_;
    document_format_t format_;
    bool open_ = true;
    version_change_callback_t on_version_change_;

  public:
    stl_database_t(stl_state_ptr_t state, document_format_t format) noexcept
        : state_(std::move(state)), version_(state_->version), format_(format) {}

    std::string const& name() const noexcept override { return state_->name; }
    version_t version() const noexcept override { return version_; }
    bool is_open() const noexcept override { return open_; }

    bool contains_store(std::string const& store) const override {
        std::shared_lock _ {state_->mutex};
        return state_->stores.count(store) != 0;
    }

    std::vector<std::string> store_names() const override {
        std::shared_lock _ {state_->mutex};
        std::vector<std::string> names;
        names.reserve(state_->stores.size());
        for (auto const& [name, _] : state_->stores)
            names.push_back(name);
        return names;
    }

    expected_gt<transaction_ptr_t> begin_transaction(std::string const& store, txn_mode_t mode) override {
        return_error_if_m(open_, error_code_t::connection_k, "Database handle is closed");
        return_error_if_m(contains_store(store),
                          error_code_t::connection_k,
                          fmt::format("Missing store `{}` in `{}`", store, state_->name));
        return transaction_ptr_t {new stl_transaction_t(state_, store, mode, format_)};
    }

    void on_version_change(version_change_callback_t callback) override { on_version_change_ = std::move(callback); }

    void notify_version_change(version_t new_version) {
        auto callback = on_version_change_;
        if (callback)
            callback(version_, new_version);
    }

    void close() noexcept override { open_ = false; }
};

class stl_upgrade_t final : public schema_upgrade_t {
    stl_state_t& state_;
    version_t old_version_;
    version_t new_version_;

  public:
    stl_upgrade_t(stl_state_t& state, version_t old_version, version_t new_version) noexcept
        : state_(state), old_version_(old_version), new_version_(new_version) {}

    version_t old_version() const noexcept override { return old_version_; }
    version_t new_version() const noexcept override { return new_version_; }
    bool contains_store(std::string const& store) const override { return state_.stores.count(store) != 0; }

    status_t create_store(std::string const& store, std::string const& key_field) override {
        return_error_if_m(!store.empty() && !key_field.empty(), error_code_t::args_wrong_k, "Empty store name or key");
        return_error_if_m(!contains_store(store), error_code_t::args_wrong_k, "Such store already exists!");
        state_.stores[store].key_field = key_field;
        return {};
    }
};

/*********************************************************/
/*****************	       Engine	      ****************/
/*********************************************************/

/**
 * @brief Registry of in-memory databases.
 * Version change and upgrade callbacks run under the registry lock,
 * so they must not reopen databases of the same engine.
 * Upgrade callbacks also hold the database lock and may only touch
 * the `schema_upgrade_t` they receive.
 */
class stl_engine_t final : public engine_t {
    document_format_t format_;
    std::mutex mutex_;
    std::map<std::string, stl_state_ptr_t> databases_;

  public:
    explicit stl_engine_t(document_format_t format) noexcept : format_(format) {}

    char const* name() const noexcept override { return "memory"; }

    expected_gt<database_ptr_t> open(std::string const& name,
                                     std::optional<version_t> version,
                                     upgrade_callback_t const& on_upgrade) override {

        return_error_if_m(!name.empty(), error_code_t::connection_k, "Empty database name");
        std::lock_guard<std::mutex> lock(mutex_);

        stl_state_ptr_t& state = databases_[name];
        if (!state) {
            state = std::make_shared<stl_state_t>();
            state->name = name;
        }

        version_t const current = state->version;
        version_t const target = version ? *version : std::max<version_t>(current, 1);
        return_error_if_m(target != 0, error_code_t::connection_k, "Version must be positive");
        return_error_if_m(target >= current,
                          error_code_t::connection_k,
                          fmt::format("Requested version {} is lower than the existing {}", target, current));

        if (target > current) {
            auto status = upgrade(*state, target, on_upgrade);
            return_if_error_m(status);
        }

        auto handle = std::make_shared<stl_database_t>(state, format_);
        state->handles.push_back(handle);
        return database_ptr_t {std::move(handle)};
    }

  private:
    status_t upgrade(stl_state_t& state, version_t target, upgrade_callback_t const& on_upgrade) {

        // Ask every other open handle to step aside
        std::vector<std::shared_ptr<stl_database_t>> live;
        for (auto const& weak : state.handles)
            if (auto handle = weak.lock(); handle && handle->is_open())
                live.push_back(std::move(handle));
        for (auto const& handle : live)
            handle->notify_version_change(target);
        for (auto const& handle : live)
            return_error_if_m(!handle->is_open(),
                              error_code_t::connection_k,
                              fmt::format("Upgrade of `{}` is blocked by an open handle", state.name));
        state.handles.clear();

        // Failed upgrades leave no trace
        std::unique_lock _ {state.mutex};
        auto stores_backup = state.stores;
        stl_upgrade_t upgrade(state, state.version, target);
        status_t status = on_upgrade //
                              ? safe_section("Upgrading schema", [&] { return on_upgrade(upgrade); })
                              : status_t {};
        if (!status) {
            state.stores = std::move(stores_backup);
            return {error_code_t::connection_k, fmt::format("Upgrade aborted: {}", status.message())};
        }

        state.version = target;
        return {};
    }
};

} // namespace

namespace unum::upersist {

engine_ptr_t make_memory_engine(document_format_t format) { return std::make_shared<stl_engine_t>(format); }

} // namespace unum::upersist
