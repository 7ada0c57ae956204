/**
 * @file config.cpp
 * @date 17 Oct 2026
 *
 * @brief Loading, validating and saving persistence configs.
 */

#include <gtest/gtest.h>

#include "upersist/cpp/config.hpp"

using namespace unum::upersist;
using namespace unum;

TEST(config, defaults) {
    config_t config;
    EXPECT_EQ(config.key_field, "id");
    EXPECT_FALSE(config.in_memory_only);
    EXPECT_EQ(config.max_upgrade_attempts, 8u);
    EXPECT_EQ(config.compaction_policy, record_error_policy_t::abort_k);
    EXPECT_EQ(config.incremental_policy, record_error_policy_t::continue_k);
    EXPECT_EQ(config.format, document_format_t::msgpack_k);
    EXPECT_EQ(config.engine.name, "rocksdb");
}

TEST(config, load_full) {
    std::string str_json = R"({
        "version": "1.0",
        "directory": "./tmp/",
        "database": "nedb",
        "store": "nedbdata",
        "key_field": "_id",
        "in_memory_only": false,
        "format": "json",
        "max_upgrade_attempts": 3,
        "compaction": {"on_record_error": "continue"},
        "incremental": {"on_record_error": "abort"},
        "engine": {
            "name": "rocksdb",
            "config_file_path": "./engine_rocksdb.ini",
            "config": {"DBOptions": {"max_open_files": 64}}
        }
    })";

    config_t config;
    auto status = config_loader_t::load_from_json_string(str_json, config);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(config.directory, "./tmp/");
    EXPECT_EQ(config.database, "nedb");
    EXPECT_EQ(config.store, "nedbdata");
    EXPECT_EQ(config.key_field, "_id");
    EXPECT_EQ(config.format, document_format_t::json_k);
    EXPECT_EQ(config.max_upgrade_attempts, 3u);
    EXPECT_EQ(config.compaction_policy, record_error_policy_t::continue_k);
    EXPECT_EQ(config.incremental_policy, record_error_policy_t::abort_k);
    EXPECT_EQ(config.engine.config_file_path, "./engine_rocksdb.ini");
    EXPECT_EQ(config.engine.config["DBOptions"]["max_open_files"], 64);
}

TEST(config, load_minimal) {
    config_t config;
    auto status = config_loader_t::load_from_json_string(R"({"version": "1.0", "in_memory_only": true})", config);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_TRUE(config.in_memory_only);
    EXPECT_EQ(config.database, "upersist");
    EXPECT_EQ(config.store, "documents");
    EXPECT_EQ(config.compaction_policy, record_error_policy_t::abort_k);
}

TEST(config, upgrade_attempts_bounds) {
    config_t config;
    auto status = config_loader_t::load_from_json_string(R"({"version": "1.0", "max_upgrade_attempts": 1})", config);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(config.max_upgrade_attempts, 1u);

    status = config_loader_t::load_from_json_string(R"({"version": "1.0", "max_upgrade_attempts": 1024})", config);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(config.max_upgrade_attempts, config_t::max_upgrade_attempts_k);
}

TEST(config, comments) {
    std::string str_json = R"({
        // Everything in RAM
        "version": "1.0",
        "engine": {"name": "memory"}
    })";
    config_t config;
    EXPECT_FALSE(config_loader_t::load_from_json_string(str_json, config));
    EXPECT_TRUE(config_loader_t::load_from_json_string(str_json, config, true));
    EXPECT_EQ(config.engine.name, "memory");
}

TEST(config, save_and_reload) {
    config_t config;
    config.directory = "/var/lib/upersist";
    config.store = "users";
    config.format = document_format_t::json_k;
    config.incremental_policy = record_error_policy_t::abort_k;
    config.engine.name = "memory";

    std::string str_json;
    EXPECT_TRUE(config_loader_t::save_to_json_string(config, str_json));

    config_t loaded;
    auto status = config_loader_t::load_from_json_string(str_json, loaded);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(loaded.directory, config.directory);
    EXPECT_EQ(loaded.store, "users");
    EXPECT_EQ(loaded.format, document_format_t::json_k);
    EXPECT_EQ(loaded.incremental_policy, record_error_policy_t::abort_k);
    EXPECT_EQ(loaded.engine.name, "memory");
}

TEST(config, invalid) {
    char const* cases[] = {
        R"([])",
        R"({"directory": "./tmp/"})",
        R"({"version": 1})",
        R"({"version": "2.0"})",
        R"({"version": "1.0.1"})",
        R"({"version": "1.0", "store": ""})",
        R"({"version": "1.0", "key_field": ""})",
        R"({"version": "1.0", "max_upgrade_attempts": 0})",
        R"({"version": "1.0", "max_upgrade_attempts": -1})",
        R"({"version": "1.0", "max_upgrade_attempts": 2.5})",
        R"({"version": "1.0", "max_upgrade_attempts": "3"})",
        R"({"version": "1.0", "max_upgrade_attempts": 1025})",
        R"({"version": "1.0", "format": "bson"})",
        R"({"version": "1.0", "compaction": {"on_record_error": "retry"}})",
        R"({"version": "1.0", "incremental": "continue"})",
        R"({"version": "1.0", "engine": {"name": "leveldb"}})",
        R"({"version": "1.0", "engine": "rocksdb"})",
        R"({"version": "1.0", "in_memory_only": "yes"})",
        R"({"version": "1.0",)",
    };
    for (auto str_json : cases) {
        config_t config;
        auto status = config_loader_t::load_from_json_string(str_json, config);
        EXPECT_EQ(status.code(), error_code_t::args_wrong_k) << str_json;
    }
}
