/**
 * @file store_connector.cpp
 *
 * @brief Bounded schema-upgrade loop, ensuring the store exists.
 */

#include <algorithm> // `std::min`

#include <fmt/format.h>

#include "upersist/cpp/store_connector.hpp"
#include "upersist/cpp/config.hpp"
#include "upersist/cpp/log.hpp"

namespace unum::upersist {

store_connector_t::store_connector_t(engine_ptr_t engine,
                                     std::string database,
                                     std::string store,
                                     std::string key_field,
                                     std::size_t max_upgrade_attempts) noexcept
    : engine_(std::move(engine)), database_(std::move(database)), store_(std::move(store)),
      key_field_(std::move(key_field)), max_upgrade_attempts_(max_upgrade_attempts) {}

store_connector_t::~store_connector_t() noexcept { release(); }

void store_connector_t::release() noexcept {
    if (!handle_)
        return;
    handle_->on_version_change({});
    handle_->close();
    handle_.reset();
}

expected_gt<database_ptr_t> store_connector_t::ensure_store() {

    return_error_if_m(engine_, error_code_t::uninitialized_state_k, "No engine to open the store with");
    if (is_connected() && handle_->contains_store(store_))
        return database_ptr_t {handle_};
    release();

    auto on_upgrade = [&](schema_upgrade_t& upgrade) -> status_t {
        ++upgrades_;
        log_info_m("Upgrading `{}` from version {} to {}", database_, upgrade.old_version(), upgrade.new_version());
        if (upgrade.contains_store(store_))
            return {};
        return upgrade.create_store(store_, key_field_);
    };

    // The first open is at the current version, every next one is an upgrade
    std::optional<version_t> version;
    std::size_t const max_upgrades = std::min(max_upgrade_attempts_, config_t::max_upgrade_attempts_k);
    for (std::size_t upgrades = 0;; ++upgrades) {
        auto maybe_db = engine_->open(database_, version, on_upgrade);
        if (!maybe_db) {
            auto status = maybe_db.release_status();
            status.recode(error_code_t::connection_k);
            return std::move(status);
        }

        database_ptr_t db = *std::move(maybe_db);
        if (db->contains_store(store_)) {
            db->on_version_change([this](version_t old_version, version_t new_version) {
                log_info_m("Closing `{}`: version change from {} to {}", database_, old_version, new_version);
                release();
            });
            handle_ = db;
            return std::move(db);
        }

        db->close();
        if (upgrades == max_upgrades)
            return status_t {error_code_t::connection_k,
                             fmt::format("Store `{}` is still missing in `{}` after {} upgrades",
                                         store_,
                                         database_,
                                         max_upgrades)};
        version = db->version() + 1;
    }
}

} // namespace unum::upersist
