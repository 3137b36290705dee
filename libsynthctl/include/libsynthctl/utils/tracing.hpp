#pragma once

#include <cstdint>
#include <string>
#include <sstream>

namespace libsynthctl {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Timestamped log lines with file/line info
 * - Performance timing measurements
 * - Environment variable control
 *
 * Control via environment variable: SYNTHCTL_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   SYNTHCTL_DEBUG("Enumerating " << n << " combinations");
 *   SYNTHCTL_TIMING_START();
 *   // ... do work ...
 *   SYNTHCTL_TIMING_END("Placebo aggregation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads SYNTHCTL_LOG_LEVEL environment variable
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
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define SYNTHCTL_LOG_AT(level, msg)                                                                                    \
	do {                                                                                                               \
		if (::libsynthctl::utils::Tracer::ShouldLog(level)) {                                                          \
			std::ostringstream synthctl_oss;                                                                           \
			synthctl_oss << msg;                                                                                       \
			::libsynthctl::utils::Tracer::Log(level, __FILE__, __LINE__, synthctl_oss.str());                          \
		}                                                                                                              \
	} while (0)

/**
 * @brief Macro for trace-level logging with stream syntax
 *
 * Usage: SYNTHCTL_TRACE(message << stream << contents)
 */
#define SYNTHCTL_TRACE(msg) SYNTHCTL_LOG_AT(::libsynthctl::utils::LogLevel::TRACE, msg)

#define SYNTHCTL_DEBUG(msg) SYNTHCTL_LOG_AT(::libsynthctl::utils::LogLevel::DBG, msg)

#define SYNTHCTL_INFO(msg) SYNTHCTL_LOG_AT(::libsynthctl::utils::LogLevel::INFO, msg)

#define SYNTHCTL_WARN(msg) SYNTHCTL_LOG_AT(::libsynthctl::utils::LogLevel::WARN, msg)

#define SYNTHCTL_ERROR(msg) SYNTHCTL_LOG_AT(::libsynthctl::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   SYNTHCTL_TIMING_START();
 *   // ... do work ...
 *   SYNTHCTL_TIMING_END("Operation name");
 */
#define SYNTHCTL_TIMING_START() uint64_t synthctl_timing_handle = ::libsynthctl::utils::Tracer::TimingStart()

#define SYNTHCTL_TIMING_END(operation_name) ::libsynthctl::utils::Tracer::TimingEnd(synthctl_timing_handle, operation_name)

} // namespace utils
} // namespace libsynthctl
