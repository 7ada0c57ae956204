/**
 * @file engine.cpp
 *
 * @brief Engine factory and the binary layout of stored documents.
 */

#include <fmt/format.h>

#include "upersist/cpp/engine.hpp"
#include "upersist/cpp/config.hpp"

namespace unum::upersist {

status_t encode_document(document_t const& doc, document_format_t format, std::string& output) noexcept {
    return safe_section("Encoding document", [&]() -> status_t {
        if (format == document_format_t::json_k) {
            output = doc.dump();
            return {};
        }
        std::vector<std::uint8_t> bytes = document_t::to_msgpack(doc);
        output.assign(bytes.begin(), bytes.end());
        return {};
    });
}

expected_gt<document_t> decode_document(char const* begin, std::size_t length, document_format_t format) noexcept {
    document_t doc;
    status_t status = safe_section("Decoding document", [&]() -> status_t {
        auto end = begin + length;
        doc = format == document_format_t::json_k //
                  ? document_t::parse(begin, end, nullptr, false)
                  : document_t::from_msgpack(begin, end, true, false);
        return_error_if_m(!doc.is_discarded(), error_code_t::transaction_k, "Corrupted document");
        return {};
    });
    if (!status)
        return {std::move(status)};
    return {std::move(doc)};
}

expected_gt<engine_ptr_t> make_engine(engine_config_t const& config,
                                      std::string const& directory,
                                      document_format_t format) {
    if (config.name == "memory")
        return make_memory_engine(format);
    if (config.name == "rocksdb")
        return make_rocksdb_engine(config, directory, format);
    return status_t {error_code_t::args_wrong_k, fmt::format("Unknown engine: {}", config.name)};
}

} // namespace unum::upersist
