/// @file sheetfork.hpp
/// @brief Umbrella header for the sheetfork-cpp library.
///
/// Include this single header for access to all public types:
/// Workspace, ForkRegistry, ForkTransaction, ForkContext, WorkbookCache,
/// RecalcLockTable, the scoped guards, configuration, and Error.

#pragma once

#include <sheetfork-cpp/config.hpp>
#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/fork_context.hpp>
#include <sheetfork-cpp/fork_registry.hpp>
#include <sheetfork-cpp/fork_transaction.hpp>
#include <sheetfork-cpp/guards.hpp>
#include <sheetfork-cpp/logging.hpp>
#include <sheetfork-cpp/recalc.hpp>
#include <sheetfork-cpp/recalc_lock_table.hpp>
#include <sheetfork-cpp/source_storage.hpp>
#include <sheetfork-cpp/types.hpp>
#include <sheetfork-cpp/workbook_cache.hpp>
#include <sheetfork-cpp/workspace.hpp>
