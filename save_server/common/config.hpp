#pragma once
#include <string>
#include <cstddef>
#include "common/logger.hpp"

struct ServerConfig
{
    std::string bind = "0.0.0.0";
    int port = 10000;
    std::string save_dir = "saves";
    size_t max_body_bytes = 5 * 1024 * 1024; // 5MB
    LogLevel log_level = LogLevel::INFO;
    std::string log_level_name = "info";     // 原始字符串，未识别时用于告警

    // 从环境变量读取：HOST / PORT / FLEX_SAVE_DIR / MAX_BODY_BYTES / LOG_LEVEL
    // 未设置或为空的变量保留默认值；数值非法时返回 false 并写入 err
    static bool from_env(ServerConfig &cfg, std::string &err);

    bool log_level_known() const;
};
