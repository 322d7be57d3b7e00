#pragma once

// Process-global Taskflow executor used by decode_batch().
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

namespace marshal_cpp::detail {

// Created on first use and sized to the hardware concurrency.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace marshal_cpp::detail
