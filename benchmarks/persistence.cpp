/**
 * @file persistence.cpp
 * @date 17 Oct 2026
 *
 * @brief Throughput of compaction and incremental persistence,
 * on the in-memory and RocksDB engines.
 */

#include <cstdlib>    // `std::getenv`
#include <filesystem> // `std::filesystem::remove_all`
#include <map>        // `std::map`
#include <random>     // `std::mt19937`

#include <fmt/format.h>
#include <benchmark/benchmark.h>

#include <upersist/upersist.hpp>

namespace bm = benchmark;
using namespace unum::upersist;

/**
 * @brief Collection of synthetic documents, identified by integers.
 */
class synthetic_collection_t final : public collection_t {
    struct executor_stub_t final : public executor_t {
        void process_buffer() override {}
    };

    std::map<doc_key_t, document_t> docs_;
    executor_stub_t executor_;

  public:
    documents_t all_data() const override {
        documents_t result;
        result.reserve(docs_.size());
        for (auto const& [_, doc] : docs_)
            result.push_back(doc);
        return result;
    }

    void reset_indexes(documents_t docs) override {
        docs_.clear();
        for (auto& doc : docs)
            docs_[encode_key(doc[default_key_field_k])] = std::move(doc);
    }

    executor_t& executor() override { return executor_; }

    void upsert(document_t doc) { docs_[encode_key(doc[default_key_field_k])] = std::move(doc); }
};

static document_t make_document(std::int64_t id, std::mt19937& gen) {
    std::uniform_int_distribution<int> choose_age(18, 99);
    return {
        {"id", id},
        {"name", fmt::format("user_{}", id)},
        {"age", choose_age(gen)},
        {"tags", {"persistence", "benchmark"}},
    };
}

static std::string bench_path() {
    char* path = std::getenv("UPERSIST_BENCH_PATH");
    return path && *path ? path : "./tmp/bench";
}

static config_t bench_config(char const* engine) {
    config_t config;
    config.engine.name = engine;
    config.directory = fmt::format("{}/{}", bench_path(), engine);
    config.engine.config = {{"WriteOptions", {{"sync", false}}}};
    std::filesystem::remove_all(config.directory);
    return config;
}

static std::unique_ptr<persistence_t> make_persistence(bm::State& state, char const* engine, collection_t& collection) {
    auto maybe_persistence = persistence_t::make(bench_config(engine), collection);
    if (!maybe_persistence) {
        state.SkipWithError(maybe_persistence.status().to_string().c_str());
        return {};
    }
    return *std::move(maybe_persistence);
}

/**
 * @brief Rewrites the whole store, replacing a tenth of it on every iteration.
 */
static void compaction(bm::State& state, char const* engine) {
    auto const docs_count = static_cast<std::int64_t>(state.range(0));
    std::mt19937 gen(42);
    synthetic_collection_t collection;
    for (std::int64_t id = 0; id != docs_count; ++id)
        collection.upsert(make_document(id, gen));

    auto persistence = make_persistence(state, engine, collection);
    if (!persistence)
        return;

    std::int64_t next_id = docs_count;
    std::size_t failures = 0;
    for (auto _ : state) {
        state.PauseTiming();
        documents_t docs = collection.all_data();
        documents_t kept(docs.begin() + docs_count / 10, docs.end());
        for (std::int64_t idx = 0; idx != docs_count / 10; ++idx)
            kept.push_back(make_document(next_id++, gen));
        collection.reset_indexes(std::move(kept));
        state.ResumeTiming();

        failures += !persistence->persist_cached_database();
    }

    state.counters["docs/s"] = bm::Counter(state.iterations() * docs_count, bm::Counter::kIsRate);
    state.counters["fails"] = bm::Counter(failures);
}

/**
 * @brief Persists batches of fresh documents with a few deletions mixed in.
 */
static void incremental(bm::State& state, char const* engine) {
    auto const batch_size = static_cast<std::int64_t>(state.range(0));
    std::mt19937 gen(42);
    synthetic_collection_t collection;
    auto persistence = make_persistence(state, engine, collection);
    if (!persistence)
        return;

    std::int64_t next_id = 0;
    std::size_t failures = 0;
    documents_t delta;
    for (auto _ : state) {
        state.PauseTiming();
        delta.clear();
        for (std::int64_t idx = 0; idx != batch_size; ++idx) {
            if (next_id && idx % 8 == 7)
                delta.push_back({{"id", next_id - 1}, {deleted_field_k, true}});
            else
                delta.push_back(make_document(next_id++, gen));
        }
        state.ResumeTiming();

        failures += !persistence->persist_new_state(delta);
    }

    state.counters["docs/s"] = bm::Counter(state.iterations() * batch_size, bm::Counter::kIsRate);
    state.counters["fails"] = bm::Counter(failures);
}

static void load(bm::State& state, char const* engine) {
    auto const docs_count = static_cast<std::int64_t>(state.range(0));
    std::mt19937 gen(42);
    synthetic_collection_t collection;
    for (std::int64_t id = 0; id != docs_count; ++id)
        collection.upsert(make_document(id, gen));

    auto persistence = make_persistence(state, engine, collection);
    if (!persistence)
        return;
    if (!persistence->persist_cached_database()) {
        state.SkipWithError("Couldn't fill the store");
        return;
    }

    std::size_t failures = 0;
    for (auto _ : state)
        failures += !persistence->load_database();

    state.counters["docs/s"] = bm::Counter(state.iterations() * docs_count, bm::Counter::kIsRate);
    state.counters["fails"] = bm::Counter(failures);
}

BENCHMARK_CAPTURE(compaction, memory, "memory")->RangeMultiplier(10)->Range(100, 10'000);
BENCHMARK_CAPTURE(compaction, rocksdb, "rocksdb")->RangeMultiplier(10)->Range(100, 10'000);
BENCHMARK_CAPTURE(incremental, memory, "memory")->RangeMultiplier(4)->Range(16, 1024);
BENCHMARK_CAPTURE(incremental, rocksdb, "rocksdb")->RangeMultiplier(4)->Range(16, 1024);
BENCHMARK_CAPTURE(load, memory, "memory")->RangeMultiplier(10)->Range(100, 10'000);
BENCHMARK_CAPTURE(load, rocksdb, "rocksdb")->RangeMultiplier(10)->Range(100, 10'000);

int main(int argc, char** argv) {
    set_log_level(log_level_t::error_k);
    bm::Initialize(&argc, argv);
    bm::RunSpecifiedBenchmarks();
    bm::Shutdown();
    return 0;
}
