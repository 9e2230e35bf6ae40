#pragma once

/**
 * @file fdreopen.hpp
 * @brief Main convenience header for FdReopenLib
 *
 * @example Reopening a log file on SIGHUP
 * @code
 * #include <fdreopen/fdreopen.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     auto log = FdReopen::Reopen<FdReopen::FdStream>::create(
 *         FdReopen::fileFactory("/var/log/app.log"), ec);
 *     if (!log)
 *         return 1;
 *     log->handle().registerSignal(SIGHUP, ec);
 *     log->writeString("started\n", ec);
 * }
 * @endcode
 */

// =============================================================================
// Core
// =============================================================================
#include "Handle.hpp"
#include "Reopen.hpp"
#include "ReopenLock.hpp"

// =============================================================================
// Streams
// =============================================================================
#include "stream/ByteStream.hpp"
#include "stream/FdStream.hpp"
#include "stream/MemoryStream.hpp"

// =============================================================================
// Signals and logging
// =============================================================================
#include "signal/SignalRegistry.hpp"
#include "sink/ReopenSink.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/Error.hpp"
#include "util/FileLockGuard.hpp"
#include "util/UniqueFd.hpp"

/**
 * @namespace FdReopen
 * @brief Root namespace for FdReopenLib
 *
 * Key components:
 * - Reopen<T>: ByteStream proxy replacing its stream on request
 * - Handle: trigger shared with signal handlers and other threads
 * - SignalRegistry: signal to Handle bindings
 * - FdStream, MemoryStream: streams to wrap
 * - ReopenSink: spdlog sink on top of Reopen
 */
namespace FdReopen {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace FdReopen
