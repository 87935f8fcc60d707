#include "util/logger.hpp"

#include <cctype>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace aurix {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none") return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level || lvl == LogLevel::None) return;

    // stderr only; stdout belongs to the flasher child
    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    if (ts[0] != '\0') {
        std::fprintf(stderr, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(stderr, "[%s] ", ToStr(lvl));
    }
    const char* base = BaseName(file);
    if (base && line > 0) {
        std::fprintf(stderr, "[%s:%d] ", base, line);
    }
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
}

} // namespace aurix
