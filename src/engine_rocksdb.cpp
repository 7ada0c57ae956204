/**
 * @file engine_rocksdb.cpp
 *
 * @brief Embedded Persistent transactional store on top of @b RocksDB.
 * It natively supports ACID transactions and iterators (range queries)
 * and is implemented via @b Log-Structured-Merge-Tree.
 *
 * ## Layout
 * Every database is a separate RocksDB instance in `<directory>/<name>`.
 * Every store is a column family, keyed by the encoded document identifier.
 * The default column family is reserved for the schema metadata:
 * > `upersist.version` - decimal schema version.
 * > `upersist.store.<name>` - key field of the store.
 *
 * ## Transactions
 * We use the `OptimisticTransactionDB`, so conflicting write transactions
 * aren't blocked, but fail on commit with a `Busy` status.
 */

#include <algorithm>  // `std::max`
#include <charconv>   // `std::from_chars`
#include <filesystem> // `std::filesystem::create_directories`
#include <map>
#include <mutex>

#include <fmt/format.h>
#include <rocksdb/db.h>
#include <rocksdb/convenience.h>
#include <rocksdb/utilities/options_util.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>

#include "upersist/cpp/engine.hpp"
#include "upersist/cpp/config.hpp"
#include "upersist/cpp/log.hpp"

namespace stdfs = std::filesystem;
using namespace unum::upersist;
using namespace unum;

/*********************************************************/
/*****************   Structures & Consts  ****************/
/*********************************************************/

namespace {

using rocks_native_t = rocksdb::OptimisticTransactionDB;
using rocks_status_t = rocksdb::Status;
using rocks_txn_t = rocksdb::Transaction;
using rocks_collection_t = rocksdb::ColumnFamilyHandle;

constexpr char const* version_key_k = "upersist.version";
constexpr char const* store_prefix_k = "upersist.store.";

class rocks_database_t;

struct rocks_state_t {
    std::string name;
    std::unique_ptr<rocks_native_t> native;
    std::map<std::string, rocks_collection_t*> columns;
    std::map<std::string, std::string> key_fields;
    version_t version = 0;
    std::vector<std::weak_ptr<rocks_database_t>> handles;

    rocks_state_t() = default;
    rocks_state_t(rocks_state_t const&) = delete;
    rocks_state_t& operator=(rocks_state_t const&) = delete;

    ~rocks_state_t() noexcept {
        if (!native)
            return;
        for (auto& [_, column] : columns)
            native->DestroyColumnFamilyHandle(column).PermitUncheckedError();
        columns.clear();
        native.reset();
    }

    rocks_collection_t* meta() const noexcept { return native->DefaultColumnFamily(); }
};

using rocks_state_ptr_t = std::shared_ptr<rocks_state_t>;

struct rocks_options_t {
    rocksdb::Options db;
    rocksdb::ColumnFamilyOptions cf;
    rocksdb::WriteOptions write;
};

inline rocksdb::Slice to_slice(std::string const& str) noexcept { return {str.data(), str.size()}; }

status_t export_error(rocks_status_t const& status, error_code_t code, doc_key_t key = {}) {
    if (status.ok())
        return {};

    char const* kind = "Failure";
    if (status.IsCorruption())
        kind = "Failure: DB Corruption";
    else if (status.IsIOError())
        kind = "Failure: IO Error";
    else if (status.IsInvalidArgument())
        kind = "Failure: Invalid Argument";
    else if (status.IsBusy() || status.IsTryAgain())
        kind = "Failure: Conflicting transaction";
    return {code, fmt::format("{}: {}", kind, status.ToString()), std::move(key)};
}

/*********************************************************/
/*****************	       Cursors	      ****************/
/*********************************************************/

/**
 * @brief Wraps a transaction iterator.
 * Must be destroyed before the transaction, that produced it.
 */
class rocks_cursor_t final : public cursor_t {
    std::unique_ptr<rocksdb::Iterator> it_;
    document_format_t format_;
    doc_key_t key_;

    status_t sync() {
        if (it_->Valid()) {
            key_.assign(it_->key().data(), it_->key().size());
            return {};
        }
        key_.clear();
        return export_error(it_->status(), error_code_t::transaction_k);
    }

  public:
    rocks_cursor_t(std::unique_ptr<rocksdb::Iterator> it, document_format_t format) noexcept
        : it_(std::move(it)), format_(format) {}

    status_t seek_first() {
        it_->SeekToFirst();
        return sync();
    }

    bool valid() const noexcept override { return it_->Valid(); }
    doc_key_t const& key() const noexcept override { return key_; }

    expected_gt<document_t> document() const override {
        rocksdb::Slice value = it_->value();
        auto maybe_doc = decode_document(value.data(), value.size(), format_);
        if (!maybe_doc)
            return status_t {error_code_t::transaction_k, maybe_doc.status().message(), key_};
        return maybe_doc;
    }

    status_t next() override {
        return_error_if_m(it_->Valid(), error_code_t::transaction_k, "Cursor is exhausted");
        it_->Next();
        return sync();
    }
};

/*********************************************************/
/*****************	    Transactions	  ****************/
/*********************************************************/

class rocks_transaction_t final : public transaction_t {
    rocks_state_ptr_t state_;
    std::string store_;
    rocks_collection_t* column_;
    std::string key_field_;
    txn_mode_t mode_;
    document_format_t format_;
    std::unique_ptr<rocks_txn_t> txn_;
    bool finished_ = false;

    status_t validate_write() const {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");
        return_error_if_m(mode_ == txn_mode_t::write_k, error_code_t::transaction_k, "Read-only transaction");
        return {};
    }

  public:
    rocks_transaction_t(rocks_state_ptr_t state,
                        std::string store,
                        txn_mode_t mode,
                        document_format_t format,
                        std::unique_ptr<rocks_txn_t> txn)
        : state_(std::move(state)), store_(std::move(store)), column_(state_->columns.at(store_)),
          key_field_(state_->key_fields[store_]), mode_(mode), format_(format), txn_(std::move(txn)) {}

    ~rocks_transaction_t() noexcept override {
        if (!finished_)
            txn_->Rollback().PermitUncheckedError();
    }

    txn_mode_t mode() const noexcept override { return mode_; }
    std::string const& store() const noexcept override { return store_; }

    expected_gt<cursor_ptr_t> open_cursor() override {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");

        rocksdb::ReadOptions options;
        options.fill_cache = false;
        std::unique_ptr<rocks_cursor_t> cursor;
        status_t status = safe_section("Creating a RocksDB iterator", [&] {
            cursor = std::make_unique<rocks_cursor_t>(
                std::unique_ptr<rocksdb::Iterator>(txn_->GetIterator(options, column_)),
                format_);
            return cursor->seek_first();
        });
        return_if_error_m(status);
        return cursor_ptr_t {std::move(cursor)};
    }

    status_t put(document_t const& doc) override {
        auto status = validate_write();
        return_if_error_m(status);

        document_t id = document_id(doc, key_field_);
        return_error_if_m(!id.is_null(),
                          error_code_t::write_k,
                          fmt::format("Missing or invalid identifier field `{}`", key_field_));

        doc_key_t key = encode_key(id);
        std::string value;
        status = encode_document(doc, format_, value);
        if (!status)
            return {error_code_t::write_k, status.message(), key};

        return export_error(txn_->Put(column_, to_slice(key), to_slice(value)), error_code_t::write_k, key);
    }

    status_t remove(doc_key_t const& key) override {
        auto status = validate_write();
        if (!status)
            return {error_code_t::delete_k, status.message(), key};
        return export_error(txn_->Delete(column_, to_slice(key)), error_code_t::delete_k, key);
    }

    status_t commit() override {
        return_error_if_m(!finished_, error_code_t::transaction_k, "Transaction is already finished");
        finished_ = true;
        if (mode_ == txn_mode_t::read_k)
            return export_error(txn_->Rollback(), error_code_t::transaction_k);
        return export_error(txn_->Commit(), error_code_t::transaction_k);
    }

    void rollback() noexcept override {
        if (finished_)
            return;
        finished_ = true;
        txn_->Rollback().PermitUncheckedError();
    }
};

/*********************************************************/
/*****************	      Databases	      ****************/
/*********************************************************/

class rocks_database_t final : public database_t {
    rocks_state_ptr_t state_;
    version_t version_;
    document_format_t format_;
    rocksdb::WriteOptions write_options_;
    bool open_ = true;
    version_change_callback_t on_version_change_;

  public:
    rocks_database_t(rocks_state_ptr_t state, document_format_t format, rocksdb::WriteOptions write_options) noexcept
        : state_(std::move(state)), version_(state_->version), format_(format), write_options_(write_options) {}

    std::string const& name() const noexcept override { return state_->name; }
    version_t version() const noexcept override { return version_; }
    bool is_open() const noexcept override { return open_; }

    bool contains_store(std::string const& store) const override { return state_->key_fields.count(store) != 0; }

    std::vector<std::string> store_names() const override {
        std::vector<std::string> names;
        names.reserve(state_->key_fields.size());
        for (auto const& [name, _] : state_->key_fields)
            names.push_back(name);
        return names;
    }

    expected_gt<transaction_ptr_t> begin_transaction(std::string const& store, txn_mode_t mode) override {
        return_error_if_m(open_, error_code_t::connection_k, "Database handle is closed");
        return_error_if_m(contains_store(store),
                          error_code_t::connection_k,
                          fmt::format("Missing store `{}` in `{}`", store, state_->name));

        rocksdb::OptimisticTransactionOptions txn_options;
        txn_options.set_snapshot = true;
        std::unique_ptr<rocks_txn_t> txn(state_->native->BeginTransaction(write_options_, txn_options));
        return_error_if_m(txn, error_code_t::connection_k, "Couldn't start a transaction!");
        return transaction_ptr_t {new rocks_transaction_t(state_, store, mode, format_, std::move(txn))};
    }

    void on_version_change(version_change_callback_t callback) override { on_version_change_ = std::move(callback); }

    void notify_version_change(version_t new_version) {
        auto callback = on_version_change_;
        if (callback)
            callback(version_, new_version);
    }

    void close() noexcept override { open_ = false; }
};

/**
 * @brief Creates column families eagerly, and removes them again if the upgrade fails.
 */
class rocks_upgrade_t final : public schema_upgrade_t {
    rocks_state_t& state_;
    rocksdb::ColumnFamilyOptions const& cf_options_;
    version_t old_version_;
    version_t new_version_;
    std::vector<std::string> created_;
    std::vector<std::string> new_columns_;

  public:
    rocks_upgrade_t(rocks_state_t& state,
                    rocksdb::ColumnFamilyOptions const& cf_options,
                    version_t old_version,
                    version_t new_version) noexcept
        : state_(state), cf_options_(cf_options), old_version_(old_version), new_version_(new_version) {}

    version_t old_version() const noexcept override { return old_version_; }
    version_t new_version() const noexcept override { return new_version_; }
    bool contains_store(std::string const& store) const override { return state_.key_fields.count(store) != 0; }
    std::vector<std::string> const& created() const noexcept { return created_; }

    status_t create_store(std::string const& store, std::string const& key_field) override {
        return_error_if_m(!store.empty() && !key_field.empty(), error_code_t::args_wrong_k, "Empty store name or key");
        return_error_if_m(store != rocksdb::kDefaultColumnFamilyName,
                          error_code_t::args_wrong_k,
                          "Default column family is reserved for metadata");
        return_error_if_m(!contains_store(store), error_code_t::args_wrong_k, "Such store already exists!");

        // A column family without metadata is a leftover of an interrupted upgrade
        if (!state_.columns.count(store)) {
            rocks_collection_t* column = nullptr;
            auto status = export_error(state_.native->CreateColumnFamily(cf_options_, store, &column),
                                       error_code_t::connection_k);
            return_if_error_m(status);
            state_.columns[store] = column;
            new_columns_.push_back(store);
        }

        state_.key_fields[store] = key_field;
        created_.push_back(store);
        return {};
    }

    void revert() noexcept {
        for (auto const& store : created_)
            state_.key_fields.erase(store);
        for (auto const& store : new_columns_) {
            auto it = state_.columns.find(store);
            if (it == state_.columns.end())
                continue;
            state_.native->DropColumnFamily(it->second).PermitUncheckedError();
            state_.native->DestroyColumnFamilyHandle(it->second).PermitUncheckedError();
            state_.columns.erase(it);
        }
        created_.clear();
        new_columns_.clear();
    }
};

/*********************************************************/
/*****************	       Engine	      ****************/
/*********************************************************/

/**
 * @brief Registry of RocksDB instances, opened lazily and kept open for the
 * lifetime of the engine, as RocksDB allows only one instance per directory.
 * Version change and upgrade callbacks run under the registry lock.
 */
class rocks_engine_t final : public engine_t {
    stdfs::path root_;
    rocks_options_t options_;
    document_format_t format_;
    std::mutex mutex_;
    std::map<std::string, rocks_state_ptr_t> databases_;

  public:
    rocks_engine_t(stdfs::path root, rocks_options_t options, document_format_t format) noexcept
        : root_(std::move(root)), options_(std::move(options)), format_(format) {}

    char const* name() const noexcept override { return "rocksdb"; }

    expected_gt<database_ptr_t> open(std::string const& name,
                                     std::optional<version_t> version,
                                     upgrade_callback_t const& on_upgrade) override {

        return_error_if_m(!name.empty(), error_code_t::connection_k, "Empty database name");
        std::lock_guard<std::mutex> lock(mutex_);

        rocks_state_ptr_t& state = databases_[name];
        if (!state) {
            auto maybe_state = open_native(name);
            if (!maybe_state) {
                databases_.erase(name);
                auto status = maybe_state.release_status();
                status.recode(error_code_t::connection_k);
                return std::move(status);
            }
            state = *std::move(maybe_state);
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

        auto handle = std::make_shared<rocks_database_t>(state, format_, options_.write);
        state->handles.push_back(handle);
        return database_ptr_t {std::move(handle)};
    }

  private:
    expected_gt<rocks_state_ptr_t> open_native(std::string const& name) {

        stdfs::path path = root_ / name;
        std::error_code fs_error;
        stdfs::create_directories(path, fs_error);
        return_error_if_m(!fs_error,
                          error_code_t::connection_k,
                          fmt::format("Couldn't create directory {}: {}", path.string(), fs_error.message()));

        rocksdb::Options options = options_.db;
        options.create_if_missing = true;

        // Recover the column families of an existing database
        std::vector<std::string> column_names;
        rocks_status_t status = rocksdb::DB::ListColumnFamilies(options, path.string(), &column_names);
        if (!status.ok() || column_names.empty())
            column_names = {rocksdb::kDefaultColumnFamilyName};

        std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
        for (auto const& column_name : column_names)
            descriptors.emplace_back(column_name, options_.cf);

        auto state = std::make_shared<rocks_state_t>();
        state->name = name;
        std::vector<rocks_collection_t*> columns;
        rocks_native_t* native = nullptr;
        status = rocks_native_t::Open(options, path.string(), descriptors, &columns, &native);
        auto exported = export_error(status, error_code_t::connection_k);
        return_if_error_m(exported);

        state->native.reset(native);
        for (auto column : columns)
            state->columns[column->GetName()] = column;

        // Recover the schema
        std::string value;
        status = state->native->Get(rocksdb::ReadOptions(), state->meta(), version_key_k, &value);
        if (status.ok()) {
            auto result = std::from_chars(value.data(), value.data() + value.size(), state->version);
            return_error_if_m(result.ec == std::errc(), error_code_t::connection_k, "Corrupted schema version");
        }
        else if (!status.IsNotFound()) {
            exported = export_error(status, error_code_t::connection_k);
            return std::move(exported);
        }

        std::unique_ptr<rocksdb::Iterator> it(state->native->NewIterator(rocksdb::ReadOptions(), state->meta()));
        rocksdb::Slice prefix(store_prefix_k);
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
            std::string store(it->key().data() + prefix.size(), it->key().size() - prefix.size());
            if (state->columns.count(store))
                state->key_fields[store] = it->value().ToString();
            else
                log_warning_m("Store `{}` of `{}` has no column family", store, name);
        }
        exported = export_error(it->status(), error_code_t::connection_k);
        return_if_error_m(exported);

        log_info_m("Opened RocksDB `{}` at version {}", path.string(), state->version);
        return std::move(state);
    }

    status_t upgrade(rocks_state_t& state, version_t target, upgrade_callback_t const& on_upgrade) {

        // Ask every other open handle to step aside
        std::vector<std::shared_ptr<rocks_database_t>> live;
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

        rocks_upgrade_t upgrade(state, options_.cf, state.version, target);
        status_t status = on_upgrade //
                              ? safe_section("Upgrading schema", [&] { return on_upgrade(upgrade); })
                              : status_t {};
        if (!status) {
            upgrade.revert();
            return {error_code_t::connection_k, fmt::format("Upgrade aborted: {}", status.message())};
        }

        // Persist the new schema atomically
        rocksdb::WriteBatch batch;
        std::string version_str = std::to_string(target);
        batch.Put(state.meta(), version_key_k, version_str).PermitUncheckedError();
        for (auto const& store : upgrade.created())
            batch.Put(state.meta(), std::string(store_prefix_k) + store, state.key_fields[store])
                .PermitUncheckedError();

        rocksdb::WriteOptions options;
        options.sync = true;
        status = export_error(state.native->Write(options, &batch), error_code_t::connection_k);
        if (!status) {
            upgrade.revert();
            return status;
        }

        state.version = target;
        return {};
    }
};

/**
 * @brief Recovering RocksDB isn't trivial and depends on a number of configuration parameters:
 * http://rocksdb.org/blog/2016/03/07/rocksdb-options-file.html
 * https://github.com/facebook/rocksdb/wiki/RocksDB-Options-File
 */
status_t load_options(engine_config_t const& config, rocks_options_t& options) {

    options.db.compression = rocksdb::kNoCompression;

    // Load from file
    auto const& config_file = config.config_file_path;
    if (!config_file.empty()) {
        rocksdb::ConfigOptions config_options;
        config_options.env = rocksdb::Env::Default();
        std::vector<rocksdb::ColumnFamilyDescriptor> column_descriptors;
        rocks_status_t status =
            rocksdb::LoadOptionsFromFile(config_options, config_file, &options.db, &column_descriptors);
        return_error_if_m(status.ok(), error_code_t::args_wrong_k, "Couldn't parse RocksDB config");
        for (auto const& descriptor : column_descriptors)
            if (descriptor.name == rocksdb::kDefaultColumnFamilyName)
                options.cf = descriptor.options;
        log_info_m("Initializing RocksDB from config: {}", config_file);
    }

    // Override with nested
    auto const& js = config.config;
    if (!js.is_object())
        return {};

    if (js.contains("DBOptions")) {
        auto const& j_db = js["DBOptions"];
        if (j_db.contains("writable_file_max_buffer_size"))
            options.db.writable_file_max_buffer_size = j_db["writable_file_max_buffer_size"];
        if (j_db.contains("max_open_files"))
            options.db.max_open_files = j_db["max_open_files"];
        if (j_db.contains("max_file_opening_threads"))
            options.db.max_file_opening_threads = j_db["max_file_opening_threads"];
    }

    if (js.contains("CFOptions")) {
        auto const& j_cf = js["CFOptions"];
        if (j_cf.contains("max_write_buffer_number"))
            options.cf.max_write_buffer_number = j_cf["max_write_buffer_number"];
        if (j_cf.contains("write_buffer_size"))
            options.cf.write_buffer_size = j_cf["write_buffer_size"];
        if (j_cf.contains("target_file_size_base"))
            options.cf.target_file_size_base = j_cf["target_file_size_base"];
        if (j_cf.contains("level0_stop_writes_trigger"))
            options.cf.level0_stop_writes_trigger = j_cf["level0_stop_writes_trigger"];
    }

    if (js.contains("WriteOptions")) {
        auto const& j_write = js["WriteOptions"];
        if (j_write.contains("sync"))
            options.write.sync = j_write["sync"];
    }
    return {};
}

} // namespace

namespace unum::upersist {

expected_gt<engine_ptr_t> make_rocksdb_engine(engine_config_t const& config,
                                              std::string const& directory,
                                              document_format_t format) {

    return_error_if_m(!directory.empty(), error_code_t::args_wrong_k, "Root directory isn't specified");
    stdfs::path root = directory;
    std::error_code fs_error;
    stdfs::create_directories(root, fs_error);
    return_error_if_m(!fs_error && stdfs::is_directory(root, fs_error),
                      error_code_t::args_wrong_k,
                      "Root isn't a directory");

    rocks_options_t options;
    auto status = safe_section("Parsing RocksDB options", [&] { return load_options(config, options); });
    return_if_error_m(status);

    return engine_ptr_t {std::make_shared<rocks_engine_t>(std::move(root), std::move(options), format)};
}

} // namespace unum::upersist
