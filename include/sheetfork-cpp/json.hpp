/// @file json.hpp
/// @brief nlohmann/json interoperability for sheetfork-cpp.
///
/// ADL serialization (to_json/from_json) for the records returned by the
/// registry and the cache, and for the configuration structs. Timestamps
/// are encoded as milliseconds since the Unix epoch, paths as strings and
/// durations as integer counts in the unit named by the key suffix.

#pragma once

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/recalc.hpp>
#include <sheetfork-cpp/types.hpp>
#include <sheetfork-cpp/workbook_cache.hpp>

#include <nlohmann/json.hpp>

namespace sheetfork_cpp {

// -- Identity types (plain strings) -------------------------------------------

void to_json(nlohmann::json& j, const WorkbookId& id);
void from_json(const nlohmann::json& j, WorkbookId& id);

void to_json(nlohmann::json& j, const ForkId& id);
void from_json(const nlohmann::json& j, ForkId& id);

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind);
void to_json(nlohmann::json& j, const Error& e);

// -- Records ------------------------------------------------------------------

void to_json(nlohmann::json& j, const EditOp& op);
void from_json(const nlohmann::json& j, EditOp& op);

void to_json(nlohmann::json& j, const ForkInfo& info);
void to_json(nlohmann::json& j, const CheckpointInfo& info);
void to_json(nlohmann::json& j, const CacheStats& stats);
void to_json(nlohmann::json& j, const CacheWarmingResult& result);
void to_json(nlohmann::json& j, const RecalcResult& result);

// -- Configuration ------------------------------------------------------------
//
// from_json keeps the default for every key that is absent.

void to_json(nlohmann::json& j, const ForkConfig& c);
void from_json(const nlohmann::json& j, ForkConfig& c);

void to_json(nlohmann::json& j, const CacheConfig& c);
void from_json(const nlohmann::json& j, CacheConfig& c);

void to_json(nlohmann::json& j, const CacheWarmingConfig& c);
void from_json(const nlohmann::json& j, CacheWarmingConfig& c);

void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

}  // namespace sheetfork_cpp
