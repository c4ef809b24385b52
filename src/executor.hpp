#pragma once

// Global work-stealing executor via Taskflow.
//
// Process-global tf::Executor sized to std::thread::hardware_concurrency().
// History verification fans out through it.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace jsonverse_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace jsonverse_cpp::detail
