#pragma once

#include <atomic>
#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

namespace libestim {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Structured logging with timestamps and file/line info
 * - Performance timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: LIBESTIM_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   ESTIM_DEBUG("Refitting replicate " << b << " of " << B);
 *   ESTIM_TIMING_START();
 *   // ... do work ...
 *   ESTIM_TIMING_END("Bootstrap loop");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads LIBESTIM_LOG_LEVEL environment variable
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Redirect output (default: std::cerr)
	 *
	 * @param sink Stream to write to, nullptr restores std::cerr
	 */
	static void SetSink(std::ostream *sink);

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	/// Timestamp and level prefix, then one line to the sink (serialized)
	static void WriteLine(LogLevel level, const std::string &body);

	static std::atomic<LogLevel> current_level_;
	static std::atomic<bool> initialized_;
	static std::ostream *sink_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define ESTIM_LOG_AT(level, msg)                                                                                       \
	do {                                                                                                               \
		if (libestim::utils::Tracer::ShouldLog(level)) {                                                               \
			std::ostringstream oss;                                                                                    \
			oss << msg;                                                                                                \
			libestim::utils::Tracer::Log(level, __FILE__, __LINE__, oss.str());                                        \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-style logging macros
 *
 * Usage: ESTIM_WARN("message " << value)
 */
#define ESTIM_TRACE(msg) ESTIM_LOG_AT(libestim::utils::LogLevel::TRACE, msg)
#define ESTIM_DEBUG(msg) ESTIM_LOG_AT(libestim::utils::LogLevel::DBG, msg)
#define ESTIM_INFO(msg)  ESTIM_LOG_AT(libestim::utils::LogLevel::INFO, msg)
#define ESTIM_WARN(msg)  ESTIM_LOG_AT(libestim::utils::LogLevel::WARN, msg)
#define ESTIM_ERROR(msg) ESTIM_LOG_AT(libestim::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   ESTIM_TIMING_START();
 *   // ... do work ...
 *   ESTIM_TIMING_END("Operation name");
 */
#define ESTIM_TIMING_START() uint64_t estim_timing_handle_ = libestim::utils::Tracer::TimingStart()

#define ESTIM_TIMING_END(operation_name) libestim::utils::Tracer::TimingEnd(estim_timing_handle_, operation_name)

} // namespace utils
} // namespace libestim
