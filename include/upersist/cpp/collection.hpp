/**
 * @file collection.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Interfaces the owning collection exposes to its persistence layer.
 */

#pragma once
#include "upersist/cpp/types.hpp"

namespace unum::upersist {

/**
 * @brief Queues the operations, issued while the collection isn't loaded yet.
 */
class executor_t {
  public:
    virtual ~executor_t() = default;

    /** @brief Runs every buffered operation, in submission order. */
    virtual void process_buffer() = 0;
};

/**
 * @brief In-memory side of the collection: documents and their indexes.
 * Owns the canonical copy of every document.
 */
class collection_t {
  public:
    virtual ~collection_t() = default;

    /** @brief Snapshot of every document, currently indexed. */
    virtual documents_t all_data() const = 0;

    /** @brief Drops all the indexes and rebuilds them from @p docs. */
    virtual void reset_indexes(documents_t docs = {}) = 0;

    virtual executor_t& executor() = 0;
};

} // namespace unum::upersist
