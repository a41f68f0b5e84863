#pragma once

#include <cstdio>

/**
 * Logging for DocRecon
 *
 * Printf-style LOG_ERROR / LOG_WARN / LOG_INFO / LOG_DEBUG / LOG_TRACE.
 * Levels below DOCRECON_LOG_LEVEL compile to nothing. Each call writes one
 * complete line, so page workers logging concurrently do not interleave.
 */

// Compile-time filename extraction
using cstr = const char*;

static constexpr auto PastLastSlash(cstr a, cstr b) -> cstr {
    return *a == '\0' ? b : *a == '/' ? PastLastSlash(a + 1, a + 1) : PastLastSlash(a + 1, b);
}

static constexpr auto PastLastSlash(cstr a) -> cstr {
    return PastLastSlash(a, a);
}

#define __SHORT_FILE__ ({ constexpr cstr sf__{PastLastSlash(__FILE__)}; sf__; })

// Log levels
#define DOCRECON_LOG_LEVEL_OFF 1000
#define DOCRECON_LOG_LEVEL_ERROR 500
#define DOCRECON_LOG_LEVEL_WARN 400
#define DOCRECON_LOG_LEVEL_INFO 300
#define DOCRECON_LOG_LEVEL_DEBUG 200
#define DOCRECON_LOG_LEVEL_TRACE 100
#define DOCRECON_LOG_LEVEL_ALL 0

#define DOCRECON_LOG_STREAM stdout

#ifndef DOCRECON_LOG_LEVEL
#ifndef NDEBUG
#define DOCRECON_LOG_LEVEL DOCRECON_LOG_LEVEL_DEBUG
#else
#define DOCRECON_LOG_LEVEL DOCRECON_LOG_LEVEL_INFO
#endif
#endif

// For compilers which do not support __FUNCTION__
#if !defined(__FUNCTION__) && !defined(__GNUC__)
#define __FUNCTION__ ""
#endif

namespace docrecon {

/**
 * @brief Writes "[time] [LEVEL] [file:line:function] " in the level's color
 * @note Caller holds the log lock
 */
void OutputLogHeader(FILE* stream, const char* file, int line, const char* func, int level);

/**
 * @brief Header plus the formatted message as one line, under the log lock
 */
void LogMessage(const char* file, int line, const char* func, int level, const char* format, ...)
    __attribute__((format(printf, 5, 6)));

} // namespace docrecon

#define DOCRECON_LOG_AT(level, ...) \
    docrecon::LogMessage(__SHORT_FILE__, __LINE__, __FUNCTION__, level, __VA_ARGS__)

#if DOCRECON_LOG_LEVEL <= DOCRECON_LOG_LEVEL_ERROR
#define LOG_ERROR(...) DOCRECON_LOG_AT(DOCRECON_LOG_LEVEL_ERROR, __VA_ARGS__)
#else
#define LOG_ERROR(...) ((void)0)
#endif

#if DOCRECON_LOG_LEVEL <= DOCRECON_LOG_LEVEL_WARN
#define LOG_WARN(...) DOCRECON_LOG_AT(DOCRECON_LOG_LEVEL_WARN, __VA_ARGS__)
#else
#define LOG_WARN(...) ((void)0)
#endif

#if DOCRECON_LOG_LEVEL <= DOCRECON_LOG_LEVEL_INFO
#define LOG_INFO(...) DOCRECON_LOG_AT(DOCRECON_LOG_LEVEL_INFO, __VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#endif

#if DOCRECON_LOG_LEVEL <= DOCRECON_LOG_LEVEL_DEBUG
#define LOG_DEBUG(...) DOCRECON_LOG_AT(DOCRECON_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_DEBUG_EXEC(fn) (fn)()
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_DEBUG_EXEC(fn) ((void)0)
#endif

#if DOCRECON_LOG_LEVEL <= DOCRECON_LOG_LEVEL_TRACE
#define LOG_TRACE(...) DOCRECON_LOG_AT(DOCRECON_LOG_LEVEL_TRACE, __VA_ARGS__)
#else
#define LOG_TRACE(...) ((void)0)
#endif
