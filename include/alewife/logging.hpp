/**
 * @file logging.hpp
 * @brief Optional logging façade shared by every alewife component.
 *
 * Unless the build defines `ALEWIFE_USE_QUILL` the log‑macros expand to
 * no‑ops, keeping the entire logging path out of the binary.
 */

#pragma once

#include <string>

#ifdef ALEWIFE_USE_QUILL
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>

#define ALEWIFE_LOG_INFO(...) LOG_INFO(__VA_ARGS__)
#define ALEWIFE_LOG_DEBUG(...) LOG_DEBUG(__VA_ARGS__)
#define ALEWIFE_LOG_WARNING(...) LOG_WARNING(__VA_ARGS__)
#define ALEWIFE_LOG_ERROR(...) LOG_ERROR(__VA_ARGS__)
#define ALEWIFE_LOG_CRITICAL(...) LOG_CRITICAL(__VA_ARGS__)

namespace alewife::logging {
using level = quill::LogLevel; ///< Logging level alias.
using Logger =
    quill::Logger*; ///< Thin pointer alias used throughout the library.

/**
 * @brief Create (or fetch) a console backed logger.
 * @param name Unique name – logger instances are cached by the backend.
 */
inline Logger create_logger(const std::string& name) {
    return quill::Frontend::create_or_get_logger(
        name, quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
                  "alewife_sink"));
}

/// Start the dedicated Quill backend thread.
inline void start_backend() { quill::Backend::start(); }

/// Set a runtime log level on a logger returned by @ref create_logger.
inline void set_log_level(Logger logger, level log_level) {
    logger->set_log_level(log_level);
}
} // namespace alewife::logging
#else
#define ALEWIFE_LOG_INFO(...)
#define ALEWIFE_LOG_DEBUG(...)
#define ALEWIFE_LOG_WARNING(...)
#define ALEWIFE_LOG_ERROR(...)
#define ALEWIFE_LOG_CRITICAL(...)

namespace alewife::logging {
/**
 * @brief Stub enumerating the log levels used in the code base, so the
 *        rest of the headers stay free of `#ifdef`s.
 */
enum class level { Info, Debug, Warning, Error, Critical };
using Logger = void*; ///< Dummy alias – pointers are never dereferenced.
inline Logger create_logger(const std::string&) { return nullptr; }
inline void start_backend() {}
inline void set_log_level(Logger, level) {}
} // namespace alewife::logging
#endif // ALEWIFE_USE_QUILL
