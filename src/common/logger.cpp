#include "common/logger.hpp"
#include <cstdarg>
#include <ctime>
#include <mutex>

namespace docrecon {

namespace {

std::mutex g_log_mutex;

struct LevelStyle {
    const char* name;
    const char* color;
};

LevelStyle StyleOf(int level) {
    switch (level) {
        case DOCRECON_LOG_LEVEL_ERROR: return {"ERROR", "\033[1;31m"};   // Red
        case DOCRECON_LOG_LEVEL_WARN:  return {"WARN", "\033[1;33m"};    // Yellow
        case DOCRECON_LOG_LEVEL_INFO:  return {"INFO", "\033[1;32m"};    // Green
        case DOCRECON_LOG_LEVEL_DEBUG: return {"DEBUG", "\033[1;36m"};   // Cyan
        case DOCRECON_LOG_LEVEL_TRACE: return {"TRACE", "\033[1;35m"};   // Magenta
        default:                       return {"UNKNOWN", "\033[0m"};
    }
}

} // namespace

void OutputLogHeader(FILE* stream, const char* file, int line, const char* func, int level) {
    LevelStyle style = StyleOf(level);

    char time_buffer[64];
    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", &tm_info);

    fprintf(stream, "%s[%s] [%s] [%s:%d:%s] \033[0m",
            style.color, time_buffer, style.name, file, line, func);
}

void LogMessage(const char* file, int line, const char* func, int level, const char* format, ...) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    OutputLogHeader(DOCRECON_LOG_STREAM, file, line, func, level);

    va_list args;
    va_start(args, format);
    vfprintf(DOCRECON_LOG_STREAM, format, args);
    va_end(args);

    fputc('\n', DOCRECON_LOG_STREAM);
    fflush(DOCRECON_LOG_STREAM);
}

} // namespace docrecon
