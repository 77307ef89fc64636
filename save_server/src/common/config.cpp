#include "common/config.hpp"
#include <cstdlib>
#include <cerrno>

namespace
{
    const char *env_or_null(const char *name)
    {
        const char *v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    bool parse_ull(const char *s, unsigned long long &out)
    {
        if (!s || *s < '0' || *s > '9')
            return false;
        char *end = nullptr;
        errno = 0;
        out = std::strtoull(s, &end, 10);
        return errno == 0 && end && *end == '\0';
    }
} // namespace

bool ServerConfig::from_env(ServerConfig &cfg, std::string &err)
{
    err.clear();

    if (const char *v = env_or_null("HOST"))
        cfg.bind = v;

    if (const char *v = env_or_null("PORT"))
    {
        unsigned long long p = 0;
        if (!parse_ull(v, p) || p == 0 || p > 65535)
        {
            err = std::string("invalid PORT: ") + v;
            return false;
        }
        cfg.port = static_cast<int>(p);
    }

    if (const char *v = env_or_null("FLEX_SAVE_DIR"))
        cfg.save_dir = v;

    if (const char *v = env_or_null("MAX_BODY_BYTES"))
    {
        unsigned long long n = 0;
        if (!parse_ull(v, n) || n == 0)
        {
            err = std::string("invalid MAX_BODY_BYTES: ") + v;
            return false;
        }
        cfg.max_body_bytes = static_cast<size_t>(n);
    }

    if (const char *v = env_or_null("LOG_LEVEL"))
    {
        cfg.log_level_name = v;
        LogLevel lvl;
        cfg.log_level = Logger::parse_level(v, lvl) ? lvl : LogLevel::INFO;
    }
    return true;
}

bool ServerConfig::log_level_known() const
{
    LogLevel ignored;
    return Logger::parse_level(log_level_name.c_str(), ignored);
}
