#pragma once

/**
 * @file isoworker.hpp
 * @brief Main header for isoworker - isolated workers with ordered shutdown
 *
 * Include this single header to access the full isoworker API.
 */

#include "isoworker/core/message.hpp"
#include "isoworker/core/channel.hpp"
#include "isoworker/core/computation.hpp"
#include "isoworker/core/output_stream.hpp"
#include "isoworker/core/logging.hpp"
#include "isoworker/core/worker.hpp"
#include "isoworker/core/pool.hpp"

namespace isoworker {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace isoworker
