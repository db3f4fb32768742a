#pragma once

// Executor for ForkRegistry::recalculate_many().
//
// Each fork in the batch becomes one Taskflow task; the per-fork recalc
// lock and the global recalc permit still bound what actually runs at once.
//
// Internal header -- not installed.

#include <taskflow/taskflow.hpp>

namespace sheetfork_cpp::detail {

// Shared by every registry in the process. Created on first use.
inline auto recalc_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace sheetfork_cpp::detail
