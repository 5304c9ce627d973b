#pragma once
#include <string_view>

namespace CS {

// Represents the possible states of a task
enum class TaskState {
    NotStarted, // Created but not yet accepted by an executor
    Starting,   // Accepted and queued
    Running,    // Executing on a worker
    Completed,  // Callable returned
    Failed      // Callable threw
};

// Convert TaskState to string for debugging/logging
std::string_view taskStateToString(TaskState state);

} // namespace CS
