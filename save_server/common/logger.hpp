#pragma once
#include <cstdio>
#include <cstdarg>

enum class LogLevel
{
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

class Logger
{
public:
    // 初始化：默认输出到 stderr，等级 INFO；颜色只在终端上启用
    static void init(LogLevel lvl = LogLevel::INFO, FILE* out = stderr);

    static void set_level(LogLevel lvl);
    static LogLevel level();

    static void set_output(FILE* out);
    static void set_color(bool enable);

    // "debug" / "info" / "warn" / "error"（大小写不敏感）
    static bool parse_level(const char* name, LogLevel& out);

    // printf 风格的日志函数
    static void log(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

private:
    static const char* level_str(LogLevel lvl);
    static const char* level_color(LogLevel lvl);
};

// 自动带上文件名和行号，格式串同 printf：%s，%d，%zu ...
#define LOG_DEBUG(fmt, ...) Logger::log(LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(LogLevel::WARN, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(LogLevel::ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
