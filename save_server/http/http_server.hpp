#pragma once
#include <string>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <unordered_set>
#include "common/config.hpp"
#include "common/noncopyable.hpp"
#include "http/save_api.hpp"

class HttpServer : NonCopyable
{
public:
    HttpServer(const ServerConfig &cfg, SaveApi &api);
    ~HttpServer();

    bool start();   // bind + listen；port 为 0 时由内核分配
    void run();     // accept 循环（阻塞），每个连接一个工作线程；返回前等所有连接处理完
    void stop();    // 请求退出（可在信号处理函数里调用）

    int port() const { return bound_port_; }

private:
    std::atomic<int> listen_fd_{-1};
    std::string bind_;
    int port_;
    int bound_port_ = 0;
    size_t max_body_;
    std::atomic<bool> stopping_{false};

    SaveApi &api_;

    // 在途连接；fd 在 mu_ 下登记和关闭，退出时据此唤醒阻塞在 recv 的连接
    std::mutex mu_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
    std::unordered_set<int> clients_;

    bool setup_listen_();
    void serve_client_(int cfd);
    void spawn_worker_(int cfd);
    void release_client_(int cfd);
    void wake_clients_();
    void wait_idle_();
};
