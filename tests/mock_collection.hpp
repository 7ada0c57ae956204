/**
 * @file mock_collection.hpp
 * @date 17 Oct 2026
 *
 * @brief Minimal in-memory collection, recording how the persistence layer drives it.
 */

#pragma once
#include <map>    // `std::map`
#include <vector> // `std::vector`

#include "upersist/upersist.hpp"

namespace unum::upersist::test {

class mock_executor_t final : public executor_t {
  public:
    std::size_t processed = 0;
    void process_buffer() override { ++processed; }
};

/**
 * @brief Keeps documents ordered by their encoded identifiers.
 */
class mock_collection_t final : public collection_t {
  public:
    std::string key_field = default_key_field_k;
    std::map<doc_key_t, document_t> docs;
    std::vector<documents_t> resets;
    mutable std::size_t snapshots = 0;
    mock_executor_t buffer;

    documents_t all_data() const override {
        ++snapshots;
        documents_t result;
        for (auto const& [_, doc] : docs)
            result.push_back(doc);
        return result;
    }

    void reset_indexes(documents_t new_docs) override {
        docs.clear();
        for (auto const& doc : new_docs)
            docs[encode_key(document_id(doc, key_field))] = doc;
        resets.push_back(std::move(new_docs));
    }

    executor_t& executor() override { return buffer; }

    void insert(document_t doc) { docs[encode_key(document_id(doc, key_field))] = std::move(doc); }
    void erase(document_t const& id) { docs.erase(encode_key(id)); }
};

} // namespace unum::upersist::test
