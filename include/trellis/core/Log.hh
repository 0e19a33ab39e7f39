#pragma once

// Trellis Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "trellis/core/Log.hh"
//   TRELLIS_LOG_INFO("Uploaded {} transforms", count);
//   TRELLIS_MATH_LOG_DEBUG("Rejected singular matrix, det={}", det);

// Neutralize X11 macro pollution.  <X11/X.h> (pulled in by windowing headers
// in the consuming renderer) defines bare-word macros that collide with
// Quill's enum member names (e.g. Always, None, Never).
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif
#ifdef True
#undef True
#endif
#ifdef False
#undef False
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <string>

namespace trellis::log {

/// Initialize the logging subsystem (console output only).
/// Safe to call more than once; does nothing once loggers exist.
void init();

/// Initialize with a file sink in addition to console. The file is written
/// at exactly this path. If loggers were already created (explicitly or by
/// the first log call), they are rebuilt with the file sink attached and
/// keep their levels. Call before other threads start logging.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Initializes console logging on first use.
quill::Logger* logger();

/// Channel logger for the matrix engine.
quill::Logger* mathLogger();

/// Path of the attached file sink, empty for console-only logging.
std::string logFilePath();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setMathLevel(quill::LogLevel level);

} // namespace trellis::log

// Trellis logging macros - wrap Quill with the root logger.
// Compile-time filtering: QUILL_COMPILE_ACTIVE_LOG_LEVEL strips levels below the ceiling.
#define TRELLIS_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(trellis::log::logger(), fmt, ##__VA_ARGS__)
#define TRELLIS_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(trellis::log::logger(), fmt, ##__VA_ARGS__)
#define TRELLIS_LOG_INFO(fmt, ...) QUILL_LOG_INFO(trellis::log::logger(), fmt, ##__VA_ARGS__)
#define TRELLIS_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(trellis::log::logger(), fmt, ##__VA_ARGS__)
#define TRELLIS_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(trellis::log::logger(), fmt, ##__VA_ARGS__)
#define TRELLIS_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(trellis::log::logger(), fmt, ##__VA_ARGS__)

#define TRELLIS_MATH_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(trellis::log::mathLogger(), fmt, ##__VA_ARGS__)
