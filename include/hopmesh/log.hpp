/**
 * @file log.hpp
 * @brief HopMesh logging: leveled, tagged, one line per record.
 *
 * @details
 * The core never owns a console. It emits short records such as
 * `[WARN] core: drop malformed frame from AA:BB` and lets the host decide
 * where they go. By default records land on `std::cerr`; tests and embedding
 * applications swap the sink with set_log_sink().
 *
 * Levels:
 * - **Debug**: per-message success paths (forwarded, surfaced, duplicate).
 * - **Info**: lifecycle (mesh started, peer connected, channel joined).
 * - **Warn**: dropped or failed traffic (malformed frame, crypto failure).
 * - **Error**: internal failures (crypto backend error, store write failed).
 *
 * Sink calls are serialized; a sink may be invoked from any forwarding thread.
 *
 * @code
 * hopmesh::set_log_level(hopmesh::LogLevel::Debug);
 * HOPMESH_LOG_INFO("core", "mesh started as " << self.to_string());
 * @endcode
 */
#ifndef HOPMESH_LOG_HPP
#define HOPMESH_LOG_HPP

#include <stdint.h>
#include <functional>
#include <sstream>
#include <string>

namespace hopmesh {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Receives one finished record. `tag` names the component, `message` has no trailing newline.
using LogSink = std::function<void(LogLevel level, const char* tag, const std::string& message)>;

/// Short upper-case name for a level ("DEBUG", "INFO", ...).
const char* to_string(LogLevel level);

void     set_log_level(LogLevel level);
LogLevel log_level();

/**
 * @brief Replace the record sink.
 * @param sink New sink; an empty function restores the default `std::cerr` sink.
 */
void set_log_sink(LogSink sink);

/// True when a record at `level` would be delivered.
bool log_enabled(LogLevel level);

/// Deliver one record to the current sink (no level check).
void log_write(LogLevel level, const char* tag, const std::string& message);

} // namespace hopmesh

// Stream-style helpers: the message expression is only built when the level is enabled.
#define HOPMESH_LOG(level, tag, expr)                                   \
  do {                                                                  \
    if (::hopmesh::log_enabled(level)) {                                \
      std::ostringstream hopmesh_log_os_;                               \
      hopmesh_log_os_ << expr;                                          \
      ::hopmesh::log_write(level, tag, hopmesh_log_os_.str());          \
    }                                                                   \
  } while (0)

#define HOPMESH_LOG_DEBUG(tag, expr) HOPMESH_LOG(::hopmesh::LogLevel::Debug, tag, expr)
#define HOPMESH_LOG_INFO(tag, expr)  HOPMESH_LOG(::hopmesh::LogLevel::Info,  tag, expr)
#define HOPMESH_LOG_WARN(tag, expr)  HOPMESH_LOG(::hopmesh::LogLevel::Warn,  tag, expr)
#define HOPMESH_LOG_ERROR(tag, expr) HOPMESH_LOG(::hopmesh::LogLevel::Error, tag, expr)

#endif // HOPMESH_LOG_HPP
