/// @file thread_pool.hpp
/// @brief Thread pool used for parallel cache warming.

#pragma once

#include <BS_thread_pool.hpp>

namespace sheetfork_cpp {

/// Shared, caller-owned pool (BS::thread_pool). One pool can serve any
/// number of caches.
using thread_pool = BS::thread_pool;

}  // namespace sheetfork_cpp
