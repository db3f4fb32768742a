// json_test.cpp -- Tests for the nlohmann/json mappings and config loading

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/json.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using namespace sheetfork_cpp;
using json = nlohmann::json;

// =============================================================================
// Configuration
// =============================================================================

TEST(ConfigJson, missing_keys_keep_defaults) {
    auto config = parse_config("{}");
    EXPECT_EQ(config.cache.capacity, 5u);
    EXPECT_EQ(config.forks.max_forks, 10u);
    EXPECT_EQ(config.forks.ttl, std::chrono::seconds{3600});
    EXPECT_EQ(config.forks.lock_timeout, std::chrono::milliseconds{30'000});
    EXPECT_TRUE(config.warming.enabled);
    EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigJson, nested_sections_override_fields) {
    auto config = parse_config(R"({
        "workspace_root": "/srv/models",
        "log_level": "debug",
        "cache": {"capacity": 12},
        "forks": {
            "fork_dir": "/var/tmp/forks",
            "ttl_secs": 120,
            "max_forks": 3,
            "lock_timeout_ms": 250,
            "supported_extensions": ["xlsx"]
        },
        "warming": {"enabled": false, "timeout_secs": 5, "workbook_ids": ["wb-aaaaaaaaaa"]}
    })");

    EXPECT_EQ(config.workspace_root, std::filesystem::path{"/srv/models"});
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.cache.capacity, 12u);
    EXPECT_EQ(config.forks.fork_dir, std::filesystem::path{"/var/tmp/forks"});
    EXPECT_EQ(config.forks.ttl, std::chrono::seconds{120});
    EXPECT_EQ(config.forks.max_forks, 3u);
    EXPECT_EQ(config.forks.lock_timeout, std::chrono::milliseconds{250});
    EXPECT_EQ(config.forks.supported_extensions, std::vector<std::string>{"xlsx"});
    // Untouched keys in a present section keep their defaults.
    EXPECT_EQ(config.forks.max_checkpoints_per_fork, 10u);
    EXPECT_FALSE(config.warming.enabled);
    EXPECT_EQ(config.warming.timeout, std::chrono::seconds{5});
    ASSERT_EQ(config.warming.workbook_ids.size(), 1u);
}

TEST(ConfigJson, workspace_root_propagates_to_sections) {
    auto config = parse_config(R"({"workspace_root": "/srv/models",
                                   "forks": {"workspace_root": "/srv/other"}})");
    EXPECT_EQ(config.cache.workspace_root, std::filesystem::path{"/srv/models"});
    EXPECT_EQ(config.forks.workspace_root, std::filesystem::path{"/srv/other"});
}

TEST(ConfigJson, serialized_config_parses_back_equal) {
    auto config = EngineConfig{};
    config.workspace_root = "/data";
    config.cache.capacity = 7;
    config.forks.max_concurrent_recalcs = 4;
    config.forks.lock_timeout = std::chrono::milliseconds{1500};
    config.warming.max_workbooks = 9;
    config.propagate_workspace_root();

    auto text = json(config).dump();
    EXPECT_EQ(parse_config(text), config);
}

TEST(ConfigJson, invalid_json_is_invalid_argument) {
    try {
        parse_config("{ not json");
        FAIL() << "expected invalid_argument";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
        EXPECT_EQ(e.error().operation, "parse_config");
    }
}

TEST(ConfigJson, wrong_value_type_is_invalid_argument) {
    EXPECT_THROW(parse_config(R"({"cache": {"capacity": "many"}})"), EngineError);
}

TEST(ConfigJson, load_config_reads_file) {
    auto dir = sheetfork_test::ScratchDir{};
    auto path = dir / "sheetfork.json";
    sheetfork_test::write_file(path, R"({"cache": {"capacity": 2}})");

    EXPECT_EQ(load_config(path).cache.capacity, 2u);
}

TEST(ConfigJson, load_config_missing_file_is_io_failure) {
    auto dir = sheetfork_test::ScratchDir{};
    try {
        load_config(dir / "absent.json");
        FAIL() << "expected io_failure";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::io_failure);
    }
}

// =============================================================================
// Records
// =============================================================================

TEST(RecordJson, cache_stats_include_hit_rate) {
    auto stats = CacheStats{.operations = 4, .hits = 3, .misses = 1, .size = 2, .capacity = 5};
    auto j = json(stats);
    EXPECT_EQ(j["operations"], 4);
    EXPECT_EQ(j["hits"], 3);
    EXPECT_EQ(j["capacity"], 5);
    EXPECT_DOUBLE_EQ(j["hit_rate"].get<double>(), 0.75);

    EXPECT_DOUBLE_EQ(json(CacheStats{}).at("hit_rate").get<double>(), 0.0);
}

TEST(RecordJson, version_conflict_error_carries_versions) {
    auto err = version_conflict("with_fork_mut_versioned", "fork-a", 1, 2).error();
    auto j = json(err);
    EXPECT_EQ(j["kind"], "version_conflict");
    EXPECT_EQ(j["retryable"], true);
    EXPECT_EQ(j["operation"], "with_fork_mut_versioned");
    EXPECT_EQ(j["subject"], "fork-a");
    EXPECT_EQ(j["expected_version"], 1);
    EXPECT_EQ(j["current_version"], 2);
}

TEST(RecordJson, plain_error_omits_empty_fields) {
    auto j = json(Error{ErrorKind::io_failure, "disk full"});
    EXPECT_EQ(j["kind"], "io_failure");
    EXPECT_EQ(j["retryable"], false);
    EXPECT_FALSE(j.contains("operation"));
    EXPECT_FALSE(j.contains("current_version"));
}

TEST(RecordJson, edit_op_reads_back) {
    auto op = EditOp{
        .timestamp = Clock::time_point{std::chrono::milliseconds{1'700'000'000'123}},
        .sheet = "Inputs",
        .address = "C7",
        .value = "=SUM(A1:A3)",
        .is_formula = true,
    };
    auto back = json(op).get<EditOp>();
    EXPECT_EQ(back, op);
}

TEST(RecordJson, edit_op_defaults_optional_fields) {
    auto op = json::parse(R"({"sheet": "S", "address": "A1", "value": "3"})").get<EditOp>();
    EXPECT_FALSE(op.is_formula);
    EXPECT_EQ(op.timestamp, Clock::time_point{});
    EXPECT_THROW(json::parse(R"({"sheet": "S"})").get<EditOp>(), json::exception);
}

TEST(RecordJson, fork_info_uses_plain_ids) {
    auto info = ForkInfo{
        .fork_id = ForkId{"fork-1"},
        .workbook_id = WorkbookId{"wb-abcdefghij"},
        .base_path = "/srv/models/a.xlsx",
        .work_path = "/tmp/forks/fork-1.xlsx",
        .version = 3,
    };
    auto j = json(info);
    EXPECT_EQ(j["fork_id"], "fork-1");
    EXPECT_EQ(j["workbook_id"], "wb-abcdefghij");
    EXPECT_EQ(j["version"], 3);
    EXPECT_EQ(j["work_path"], "/tmp/forks/fork-1.xlsx");
}

TEST(RecordJson, checkpoint_label_is_optional) {
    auto cp = CheckpointInfo{.checkpoint_id = "cp-1", .fork_id = ForkId{"fork-1"}};
    EXPECT_FALSE(json(cp).contains("label"));
    cp.label = "before import";
    EXPECT_EQ(json(cp)["label"], "before import");
}
