/**
 * @file types.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Documents, keys and markers shared by the engines and the persistence layer.
 */

#pragma once
#include <cstdint>     // `std::uint64_t`
#include <string>      // `std::string`
#include <vector>      // `std::vector`

#include <nlohmann/json.hpp> // `nlohmann::ordered_json`

namespace unum::upersist {

/**
 * @brief Documents keep the order of their fields, as the owning
 * collection produced them, so we use the insertion-ordered flavour.
 */
using document_t = nlohmann::ordered_json;
using documents_t = std::vector<document_t>;

/**
 * @brief Durable key of a record: canonical JSON dump of the identifier.
 * Using the dump instead of the raw string keeps `"1"` and `1` apart.
 */
using doc_key_t = std::string;
using version_t = std::uint64_t;

constexpr char const* default_key_field_k = "id";
constexpr char const* deleted_field_k = "$$deleted";
constexpr char const* index_created_field_k = "$$indexCreated";
constexpr char const* index_removed_field_k = "$$indexRemoved";

enum class txn_mode_t { read_k, write_k };

/**
 * @brief Binary layout of documents inside the engine.
 * MessagePack is denser, JSON is easier to inspect with external tools.
 */
enum class document_format_t { msgpack_k, json_k };

inline bool flag_is_set(document_t const& doc, char const* field) {
    if (!doc.is_object())
        return false;
    auto it = doc.find(field);
    return it != doc.end() && it->is_boolean() && it->get<bool>();
}

inline bool is_tombstone(document_t const& doc) {
    return flag_is_set(doc, deleted_field_k);
}

inline bool is_metadata_marker(document_t const& doc) {
    return flag_is_set(doc, index_created_field_k) || flag_is_set(doc, index_removed_field_k);
}

/**
 * @brief Only strings and integers can identify documents.
 */
inline bool is_valid_id(document_t const& id) noexcept {
    return id.is_string() || id.is_number_integer();
}

inline doc_key_t encode_key(document_t const& id) { return id.dump(); }

/**
 * @brief Extracts the identifier of @p doc through @p key_field.
 * @return `nullptr`-valued JSON if the field is missing or has an unsupported type.
 */
inline document_t document_id(document_t const& doc, std::string const& key_field) {
    if (!doc.is_object())
        return nullptr;
    auto it = doc.find(key_field);
    if (it == doc.end() || !is_valid_id(*it))
        return nullptr;
    return *it;
}

} // namespace unum::upersist
