#pragma once

// Stride Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "stride/core/Log.hh"
//   STRIDE_LOG_INFO("Character spawned with height {}", height);
//   STRIDE_LOG_WARN("Unknown cast type {}", static_cast<int>(type));

// Neutralize X11 macro pollution.  <X11/X.h> (pulled in transitively by some
// Linux system headers) defines bare-word macros that collide with Quill's
// enum member names (e.g. Always, None, Never).
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

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace stride::log {

/// Initialize the logging subsystem (console output only).
/// Call once at startup before any logging.
void init();

/// Initialize with file sink in addition to console.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Valid after init().
quill::Logger* logger();

/// Subsystem loggers. Valid after init().
quill::Logger* physicsLogger();
quill::Logger* movementLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setPhysicsLevel(quill::LogLevel level);
void setMovementLevel(quill::LogLevel level);

} // namespace stride::log

// Stride logging macros - wrap Quill with the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define STRIDE_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(stride::log::logger(), fmt, ##__VA_ARGS__)
#define STRIDE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(stride::log::logger(), fmt, ##__VA_ARGS__)
#define STRIDE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(stride::log::logger(), fmt, ##__VA_ARGS__)
#define STRIDE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(stride::log::logger(), fmt, ##__VA_ARGS__)
#define STRIDE_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(stride::log::logger(), fmt, ##__VA_ARGS__)
#define STRIDE_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(stride::log::logger(), fmt, ##__VA_ARGS__)

// Subsystem channels
#define STRIDE_PHYSICS_DEBUG(fmt, ...) QUILL_LOG_DEBUG(stride::log::physicsLogger(), fmt, ##__VA_ARGS__)
#define STRIDE_PHYSICS_INFO(fmt, ...) QUILL_LOG_INFO(stride::log::physicsLogger(), fmt, ##__VA_ARGS__)
#define STRIDE_PHYSICS_WARN(fmt, ...) QUILL_LOG_WARNING(stride::log::physicsLogger(), fmt, ##__VA_ARGS__)
#define STRIDE_MOVEMENT_DEBUG(fmt, ...) QUILL_LOG_DEBUG(stride::log::movementLogger(), fmt, ##__VA_ARGS__)
#define STRIDE_MOVEMENT_INFO(fmt, ...) QUILL_LOG_INFO(stride::log::movementLogger(), fmt, ##__VA_ARGS__)
#define STRIDE_MOVEMENT_WARN(fmt, ...) QUILL_LOG_WARNING(stride::log::movementLogger(), fmt, ##__VA_ARGS__)
