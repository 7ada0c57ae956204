/**
 * @file instrumented_engine.hpp
 * @date 17 Oct 2026
 *
 * @brief Engine decorator, counting the calls that reach the underlying
 * engine and injecting failures into chosen ones.
 */

#pragma once
#include <memory>        // `std::shared_ptr`
#include <string>        // `std::string`
#include <unordered_set> // `std::unordered_set`

#include "upersist/upersist.hpp"

namespace unum::upersist::test {

struct counters_t {
    std::size_t opens = 0;
    std::size_t upgrades = 0;
    std::size_t begins = 0;
    std::size_t cursors = 0;
    std::size_t cursor_steps = 0;
    std::size_t puts = 0;
    std::size_t removes = 0;
    std::size_t commits = 0;

    std::size_t io() const noexcept { return opens + begins + cursors + puts + removes + commits; }
};

struct faults_t {
    bool fail_open = false;
    bool fail_begin = false;
    bool fail_cursor = false;
    bool fail_commit = false;
    bool fail_decode = false;
    /** @brief Runs upgrades without the schema changes, the caller asked for. */
    bool skip_upgrades = false;
    /** @brief Encoded identifiers, whose puts must fail. */
    std::unordered_set<doc_key_t> failing_puts;
    /** @brief Encoded keys, whose deletions must fail. */
    std::unordered_set<doc_key_t> failing_removes;
};

struct probe_t {
    counters_t counters;
    faults_t faults;
    std::string key_field = default_key_field_k;
};

using probe_ptr_t = std::shared_ptr<probe_t>;

class instrumented_cursor_t final : public cursor_t {
    cursor_ptr_t inner_;
    probe_ptr_t probe_;

  public:
    instrumented_cursor_t(cursor_ptr_t inner, probe_ptr_t probe) noexcept
        : inner_(std::move(inner)), probe_(std::move(probe)) {}

    bool valid() const noexcept override { return inner_->valid(); }
    doc_key_t const& key() const noexcept override { return inner_->key(); }
    expected_gt<document_t> document() const override {
        if (probe_->faults.fail_decode)
            return status_t {error_code_t::transaction_k, "Injected decode failure", inner_->key()};
        return inner_->document();
    }
    status_t next() override {
        ++probe_->counters.cursor_steps;
        return inner_->next();
    }
};

class instrumented_transaction_t final : public transaction_t {
    transaction_ptr_t inner_;
    probe_ptr_t probe_;

  public:
    instrumented_transaction_t(transaction_ptr_t inner, probe_ptr_t probe) noexcept
        : inner_(std::move(inner)), probe_(std::move(probe)) {}

    txn_mode_t mode() const noexcept override { return inner_->mode(); }
    std::string const& store() const noexcept override { return inner_->store(); }

    expected_gt<cursor_ptr_t> open_cursor() override {
        ++probe_->counters.cursors;
        return_error_if_m(!probe_->faults.fail_cursor, error_code_t::transaction_k, "Injected cursor failure");
        auto maybe_cursor = inner_->open_cursor();
        if (!maybe_cursor)
            return maybe_cursor.release_status();
        return cursor_ptr_t {new instrumented_cursor_t(*std::move(maybe_cursor), probe_)};
    }

    status_t put(document_t const& doc) override {
        ++probe_->counters.puts;
        document_t id = document_id(doc, probe_->key_field);
        if (!id.is_null() && probe_->faults.failing_puts.count(encode_key(id)))
            return {error_code_t::write_k, "Injected put failure", encode_key(id)};
        return inner_->put(doc);
    }

    status_t remove(doc_key_t const& key) override {
        ++probe_->counters.removes;
        if (probe_->faults.failing_removes.count(key))
            return {error_code_t::delete_k, "Injected delete failure", key};
        return inner_->remove(key);
    }

    status_t commit() override {
        ++probe_->counters.commits;
        if (probe_->faults.fail_commit) {
            inner_->rollback();
            return {error_code_t::transaction_k, "Injected commit failure"};
        }
        return inner_->commit();
    }

    void rollback() noexcept override { inner_->rollback(); }
};

class instrumented_database_t final : public database_t {
    database_ptr_t inner_;
    probe_ptr_t probe_;

  public:
    instrumented_database_t(database_ptr_t inner, probe_ptr_t probe) noexcept
        : inner_(std::move(inner)), probe_(std::move(probe)) {}

    std::string const& name() const noexcept override { return inner_->name(); }
    version_t version() const noexcept override { return inner_->version(); }
    bool is_open() const noexcept override { return inner_->is_open(); }
    bool contains_store(std::string const& store) const override { return inner_->contains_store(store); }
    std::vector<std::string> store_names() const override { return inner_->store_names(); }

    expected_gt<transaction_ptr_t> begin_transaction(std::string const& store, txn_mode_t mode) override {
        ++probe_->counters.begins;
        return_error_if_m(!probe_->faults.fail_begin, error_code_t::transaction_k, "Injected begin failure");
        auto maybe_txn = inner_->begin_transaction(store, mode);
        if (!maybe_txn)
            return maybe_txn.release_status();
        return transaction_ptr_t {new instrumented_transaction_t(*std::move(maybe_txn), probe_)};
    }

    void on_version_change(version_change_callback_t callback) override {
        inner_->on_version_change(std::move(callback));
    }
    void close() noexcept override { inner_->close(); }
};

class instrumented_engine_t final : public engine_t {
    engine_ptr_t inner_;
    probe_ptr_t probe_;

  public:
    instrumented_engine_t(engine_ptr_t inner, probe_ptr_t probe) noexcept
        : inner_(std::move(inner)), probe_(std::move(probe)) {}

    char const* name() const noexcept override { return inner_->name(); }

    expected_gt<database_ptr_t> open(std::string const& name,
                                     std::optional<version_t> version,
                                     upgrade_callback_t const& on_upgrade) override {
        ++probe_->counters.opens;
        return_error_if_m(!probe_->faults.fail_open, error_code_t::connection_k, "Injected open failure");

        probe_ptr_t probe = probe_;
        upgrade_callback_t counted = [&on_upgrade, probe](schema_upgrade_t& upgrade) -> status_t {
            ++probe->counters.upgrades;
            if (probe->faults.skip_upgrades)
                return {};
            return on_upgrade ? on_upgrade(upgrade) : status_t {};
        };
        auto maybe_db = inner_->open(name, version, counted);
        if (!maybe_db)
            return maybe_db.release_status();
        return database_ptr_t {std::make_shared<instrumented_database_t>(*std::move(maybe_db), probe_)};
    }
};

inline engine_ptr_t instrument(engine_ptr_t inner, probe_ptr_t probe) {
    return std::make_shared<instrumented_engine_t>(std::move(inner), std::move(probe));
}

} // namespace unum::upersist::test
