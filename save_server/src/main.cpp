#include <csignal>
#include <cstdlib>
#include <string>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "store/save_store.hpp"
#include "http/save_api.hpp"
#include "http/http_server.hpp"

static HttpServer *g_http = nullptr;

static void handle_signal(int)
{
    if (g_http)
        g_http->stop();
}

int main()
{
    Logger::init(LogLevel::INFO);

    ServerConfig cfg;
    std::string err;
    if (!ServerConfig::from_env(cfg, err))
    {
        LOG_ERROR("config error: %s", err.c_str());
        return EXIT_FAILURE;
    }
    Logger::set_level(cfg.log_level);
    if (!cfg.log_level_known())
        LOG_WARN("unknown LOG_LEVEL '%s', using info", cfg.log_level_name.c_str());

    // 存档目录不可写则直接退出：没有它任何请求都无法正确处理
    SaveStore store(cfg.save_dir);
    if (!store.init(err))
    {
        LOG_ERROR("cannot use save directory %s: %s", cfg.save_dir.c_str(), err.c_str());
        return EXIT_FAILURE;
    }

    SaveApi api(store);
    HttpServer http(cfg, api);
    if (!http.start())
    {
        LOG_ERROR("HTTP start failed");
        return EXIT_FAILURE;
    }
    g_http = &http;

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    LOG_INFO("Server running on port %d", http.port());
    http.run();

    g_http = nullptr;
    LOG_INFO("Server exited. Bye.");
    return EXIT_SUCCESS;
}
