/**
 * @file persistence.cpp
 */

#include "upersist/cpp/persistence.hpp"

namespace unum::upersist {

persistence_t::persistence_t(config_t config, collection_t& collection, engine_ptr_t engine)
    : config_(std::move(config)), collection_(collection), engine_(std::move(engine)),
      connector_(engine_, config_.database, config_.store, config_.key_field, config_.max_upgrade_attempts),
      runner_(connector_), compactor_(runner_, collection_, config_), persister_(runner_, collection_, config_),
      loader_(runner_, collection_, config_) {}

expected_gt<std::unique_ptr<persistence_t>> persistence_t::make(config_t config, collection_t& collection) {

    engine_ptr_t engine;
    if (!config.in_memory_only) {
        auto maybe_engine = make_engine(config.engine, config.directory, config.format);
        if (!maybe_engine)
            return maybe_engine.release_status();
        engine = *std::move(maybe_engine);
    }

    return std::make_unique<persistence_t>(std::move(config), collection, std::move(engine));
}

status_t persistence_t::load_database() { return loader_.run(); }

void persistence_t::load_database(done_callback_t const& callback) {
    auto status = load_database();
    if (callback)
        callback(std::move(status));
}

status_t persistence_t::persist_new_state(documents_t const& delta) { return persister_.run(delta); }

void persistence_t::persist_new_state(documents_t const& delta, done_callback_t const& callback) {
    auto status = persist_new_state(delta);
    if (callback)
        callback(std::move(status));
}

status_t persistence_t::persist_cached_database() { return compactor_.run(); }

void persistence_t::persist_cached_database(done_callback_t const& callback) {
    auto status = persist_cached_database();
    if (callback)
        callback(std::move(status));
}

} // namespace unum::upersist
