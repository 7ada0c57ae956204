/**
 * @file config.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Persistence configurations and their JSON loader.
 */

#pragma once
#include <cstdint>           // `std::uint8_t`
#include <limits>            // `std::numeric_limits`
#include <string>            // `std::string`
#include <nlohmann/json.hpp> // `nlohmann::json`
#include <fmt/format.h>      // `fmt::format`

#include "upersist/cpp/types.hpp"
#include "upersist/cpp/status.hpp"

namespace unum::upersist {

using json_t = nlohmann::json;

/**
 * @brief What to do when a single put or delete fails in the middle of a batch.
 *
 * @abort_k: Stop issuing operations, commit what was applied, report the error.
 * @continue_k: Log the error and move on to the next record.
 */
enum class record_error_policy_t { abort_k, continue_k };

/**
 * @brief Engine configuration
 *
 * @name: "rocksdb" or "memory".
 * @config_file_path: Local RocksDB options file.
 * @config: Engine options in key-value format, overriding the file.
 */
struct engine_config_t {
    std::string name = "rocksdb";
    std::string config_file_path;
    json_t config;
};

/**
 * @brief Persistence configuration
 *
 * @directory: Root path, where persistent engines keep their databases.
 * @database: Name of the database, holding one or more stores.
 * @store: Name of the store, holding the documents of one collection.
 * @key_field: Identifier field of the documents, used as the store key.
 * @in_memory_only: Skip all I/O, every operation succeeds immediately.
 * @max_upgrade_attempts: Bound on schema upgrades while ensuring the store exists,
 * from 1 to `max_upgrade_attempts_k`.
 */
struct config_t {
    static constexpr std::size_t default_max_upgrade_attempts_k = 8;
    static constexpr std::size_t max_upgrade_attempts_k = 1024;

    std::string directory;
    std::string database = "upersist";
    std::string store = "documents";
    std::string key_field = default_key_field_k;
    bool in_memory_only = false;
    document_format_t format = document_format_t::msgpack_k;
    std::size_t max_upgrade_attempts = default_max_upgrade_attempts_k;
    record_error_policy_t compaction_policy = record_error_policy_t::abort_k;
    record_error_policy_t incremental_policy = record_error_policy_t::continue_k;
    engine_config_t engine;
};

/**
 * @brief Persistence configurations loader
 */
class config_loader_t {
  public:
    static constexpr std::uint8_t current_major_version_k = 1;
    static constexpr std::uint8_t current_minor_version_k = 0;

  public:
    static inline status_t load_from_json(json_t const& json, config_t& config);
    static inline status_t load_from_json_string(std::string const& str_json,
                                                 config_t& config,
                                                 bool ignore_comments = false);

    static inline status_t save_to_json(config_t const& config, json_t& json);
    static inline status_t save_to_json_string(config_t const& config, std::string& str_json);

  private:
    static inline std::string current_version();
    static inline status_t validate_config(json_t const& json);

    static inline bool parse_version(std::string const& str_version,
                                     std::uint8_t& major,
                                     std::uint8_t& minor) noexcept;
    static inline bool parse_policy(json_t const& json, record_error_policy_t& policy);
    static inline bool parse_format(std::string const& str, document_format_t& format) noexcept;

    static inline char const* policy_name(record_error_policy_t policy) noexcept;
    static inline char const* format_name(document_format_t format) noexcept;
};

inline status_t config_loader_t::load_from_json(json_t const& json, config_t& config) {

    auto status = validate_config(json);
    if (!status)
        return status;

    try {
        config.directory = json.value("directory", "");
        config.database = json.value("database", config.database);
        config.store = json.value("store", config.store);
        config.key_field = json.value("key_field", config.key_field);
        config.in_memory_only = json.value("in_memory_only", false);
        if (auto it = json.find("max_upgrade_attempts"); it != json.end()) {
            return_error_if_m(it->type() == json_t::value_t::number_unsigned,
                              error_code_t::args_wrong_k,
                              "Upgrade attempts must be a positive integer");
            auto attempts = it->get<std::uint64_t>();
            return_error_if_m(attempts <= config_t::max_upgrade_attempts_k,
                              error_code_t::args_wrong_k,
                              fmt::format("Upgrade attempts can't exceed {}", config_t::max_upgrade_attempts_k));
            config.max_upgrade_attempts = static_cast<std::size_t>(attempts);
        }

        return_error_if_m(!config.database.empty(), error_code_t::args_wrong_k, "Empty database name");
        return_error_if_m(!config.store.empty(), error_code_t::args_wrong_k, "Empty store name");
        return_error_if_m(!config.key_field.empty(), error_code_t::args_wrong_k, "Empty key field");
        return_error_if_m(config.max_upgrade_attempts, error_code_t::args_wrong_k, "Upgrade attempts must be positive");

        if (json.contains("format"))
            return_error_if_m(parse_format(json["format"].get<std::string>(), config.format),
                              error_code_t::args_wrong_k,
                              "Unknown document format");

        if (json.contains("compaction"))
            return_error_if_m(parse_policy(json["compaction"], config.compaction_policy),
                              error_code_t::args_wrong_k,
                              "Invalid compaction config");
        if (json.contains("incremental"))
            return_error_if_m(parse_policy(json["incremental"], config.incremental_policy),
                              error_code_t::args_wrong_k,
                              "Invalid incremental config");

        // Engine
        if (json.contains("engine")) {
            auto const& engine = json["engine"];
            return_error_if_m(engine.is_object(), error_code_t::args_wrong_k, "Invalid engine config");
            config.engine.name = engine.value("name", config.engine.name);
            config.engine.config_file_path = engine.value("config_file_path", "");
            if (engine.contains("config"))
                config.engine.config = engine["config"];
        }
        return_error_if_m(config.engine.name == "rocksdb" || config.engine.name == "memory",
                          error_code_t::args_wrong_k,
                          fmt::format("Unknown engine: {}", config.engine.name));
    }
    catch (json_t::exception const& e) {
        return {error_code_t::args_wrong_k, fmt::format("Invalid json config file: {}", e.what())};
    }

    return {};
}

inline status_t config_loader_t::load_from_json_string(std::string const& str_json,
                                                       config_t& config,
                                                       bool ignore_comments) {
    auto json = json_t::parse(str_json, nullptr, false, ignore_comments);
    return_error_if_m(!json.is_discarded(), error_code_t::args_wrong_k, "Config isn't a valid JSON");
    return load_from_json(json, config);
}

inline status_t config_loader_t::save_to_json(config_t const& config, json_t& json) {

    json.clear();
    json["version"] = current_version();
    json["directory"] = config.directory;
    json["database"] = config.database;
    json["store"] = config.store;
    json["key_field"] = config.key_field;
    json["in_memory_only"] = config.in_memory_only;
    json["format"] = format_name(config.format);
    json["max_upgrade_attempts"] = config.max_upgrade_attempts;
    json["compaction"] = {{"on_record_error", policy_name(config.compaction_policy)}};
    json["incremental"] = {{"on_record_error", policy_name(config.incremental_policy)}};

    // Engine
    json_t j_engine;
    j_engine["name"] = config.engine.name;
    j_engine["config_file_path"] = config.engine.config_file_path;
    j_engine["config"] = config.engine.config;
    json["engine"] = j_engine;

    return {};
}

inline status_t config_loader_t::save_to_json_string(config_t const& config, std::string& str_json) {
    json_t json;
    auto status = save_to_json(config, json);
    if (!status)
        return status;

    str_json = json.dump();
    return {};
}

inline std::string config_loader_t::current_version() {
    return fmt::format("{}.{}", current_major_version_k, current_minor_version_k);
}

inline status_t config_loader_t::validate_config(json_t const& json) {

    return_error_if_m(json.is_object(), error_code_t::args_wrong_k, "Config must be a JSON object");
    auto it = json.find("version");
    return_error_if_m(it != json.end() && it->is_string(), error_code_t::args_wrong_k, "Missing version");

    std::uint8_t major_version = 0;
    std::uint8_t minor_version = 0;
    return_error_if_m(parse_version(it->get<std::string>(), major_version, minor_version),
                      error_code_t::args_wrong_k,
                      "Invalid version format");
    return_error_if_m(major_version == current_major_version_k && minor_version == current_minor_version_k,
                      error_code_t::args_wrong_k,
                      "Version not supported");
    return {};
}

inline bool config_loader_t::parse_version(std::string const& str_version,
                                           std::uint8_t& major,
                                           std::uint8_t& minor) noexcept {

    unsigned long mj = 0;
    unsigned long mn = 0;
    try {
        std::size_t pos = 0;
        std::string str = str_version;
        mj = std::stoul(str, &pos);
        if (pos == str.size() || str[pos] != '.')
            return false;
        str = str.substr(++pos);
        mn = std::stoul(str, &pos);
        if (pos < str.size())
            return false;
    }
    catch (std::logic_error const&) {
        return false;
    }
    if (mj > std::numeric_limits<std::uint8_t>::max() || mn > std::numeric_limits<std::uint8_t>::max())
        return false;

    major = static_cast<std::uint8_t>(mj);
    minor = static_cast<std::uint8_t>(mn);
    return true;
}

inline bool config_loader_t::parse_policy(json_t const& json, record_error_policy_t& policy) {

    if (!json.is_object())
        return false;
    auto it = json.find("on_record_error");
    if (it == json.end())
        return true; // Keep the default
    if (!it->is_string())
        return false;

    auto const& str = it->get_ref<std::string const&>();
    if (str == "abort")
        policy = record_error_policy_t::abort_k;
    else if (str == "continue")
        policy = record_error_policy_t::continue_k;
    else
        return false;
    return true;
}

inline bool config_loader_t::parse_format(std::string const& str, document_format_t& format) noexcept {
    if (str == "msgpack")
        format = document_format_t::msgpack_k;
    else if (str == "json")
        format = document_format_t::json_k;
    else
        return false;
    return true;
}

inline char const* config_loader_t::policy_name(record_error_policy_t policy) noexcept {
    return policy == record_error_policy_t::abort_k ? "abort" : "continue";
}

inline char const* config_loader_t::format_name(document_format_t format) noexcept {
    return format == document_format_t::msgpack_k ? "msgpack" : "json";
}

} // namespace unum::upersist
