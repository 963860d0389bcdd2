/**
 * @file worker.cpp
 * @brief Worker implementation
 */

#include "isoworker/core/worker.hpp"

namespace isoworker {

// The worker itself is a template and lives in the header.

const char* to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Created:      return "Created";
        case WorkerState::Started:      return "Started";
        case WorkerState::Running:      return "Running";
        case WorkerState::ShuttingDown: return "ShuttingDown";
        case WorkerState::Terminated:   return "Terminated";
    }
    return "Unknown";
}

} // namespace isoworker
