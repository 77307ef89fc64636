#include "common/logger.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <array>
#include <chrono>
#include <ctime>
#include <cstring>
#include <strings.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace
{

    static std::mutex g_mu;
    static std::atomic<LogLevel> g_level{LogLevel::INFO};
    static FILE *g_out = stderr;
    static bool g_color = false;

    inline unsigned long get_tid()
    {
        return static_cast<unsigned long>(::syscall(SYS_gettid));
    }

    inline const char *basename2(const char *path)
    {
        if (!path)
            return "";
        const char *p = std::strrchr(path, '/');
        return p ? (p + 1) : path;
    }

    inline bool is_tty(FILE *f)
    {
        return f && ::isatty(::fileno(f)) == 1;
    }

    // yyyy-mm-dd HH:MM:SS.mmm
    inline void format_timestamp(char *buf, size_t n)
    {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto secs = time_point_cast<seconds>(now);
        auto ms = duration_cast<milliseconds>(now - secs).count();

        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        std::snprintf(buf, n, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<long>(ms));
    }

} // namespace

void Logger::init(LogLevel lvl, FILE *out)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_level = lvl;
    g_out = out ? out : stderr;
    g_color = is_tty(g_out);
}

void Logger::set_level(LogLevel lvl)
{
    g_level.store(lvl);
}

LogLevel Logger::level()
{
    return g_level.load();
}

void Logger::set_output(FILE *out)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_out = out ? out : stderr;
    g_color = is_tty(g_out);
}

void Logger::set_color(bool enable)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_color = enable;
}

bool Logger::parse_level(const char *name, LogLevel &out)
{
    if (!name)
        return false;
    if (::strcasecmp(name, "debug") == 0)
        out = LogLevel::DEBUG;
    else if (::strcasecmp(name, "info") == 0)
        out = LogLevel::INFO;
    else if (::strcasecmp(name, "warn") == 0 || ::strcasecmp(name, "warning") == 0)
        out = LogLevel::WARN;
    else if (::strcasecmp(name, "error") == 0)
        out = LogLevel::ERROR;
    else
        return false;
    return true;
}

const char *Logger::level_str(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char *Logger::level_color(LogLevel lvl)
{
    if (!g_color)
        return "";

    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "\033[36m";
    case LogLevel::INFO:
        return "\033[32m";
    case LogLevel::WARN:
        return "\033[33m";
    case LogLevel::ERROR:
        return "\033[31m";
    }
    return "";
}

void Logger::log(LogLevel lvl, const char *file, int line, const char *fmt, ...)
{
    if (static_cast<int>(lvl) < static_cast<int>(g_level.load(std::memory_order_relaxed)))
        return;

    std::lock_guard<std::mutex> lk(g_mu);

    // 整行先拼到栈缓冲，避免多线程交叉
    std::array<char, 2048> buf{};
    size_t pos = 0;
    auto room = [&]() { return pos < buf.size() ? buf.size() - pos : 0; };
    auto advance = [&](int n) {
        if (n > 0)
            pos = std::min(pos + static_cast<size_t>(n), buf.size() - 1);
    };

    char ts[64];
    format_timestamp(ts, sizeof(ts));
    advance(std::snprintf(buf.data() + pos, room(), "[%s]", ts));

    const char *c = level_color(lvl);
    const char *r = g_color ? "\033[0m" : "";
    advance(std::snprintf(buf.data() + pos, room(), "%s[%s]%s", c, level_str(lvl), r));

    advance(std::snprintf(buf.data() + pos, room(), "[tid:%lu]", get_tid()));
    advance(std::snprintf(buf.data() + pos, room(), "[%s:%d] ", basename2(file), line));

    va_list ap;
    va_start(ap, fmt);
    advance(std::vsnprintf(buf.data() + pos, room(), fmt, ap));
    va_end(ap);

    // 每条一行；缓冲不够时截断并强行结尾
    if (pos >= buf.size() - 1)
        pos = buf.size() - 2;
    buf[pos++] = '\n';
    buf[pos] = '\0';

    std::fwrite(buf.data(), 1, pos, g_out);
    std::fflush(g_out);
}
