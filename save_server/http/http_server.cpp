#include "http/http_server.hpp"
#include "common/logger.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <system_error>
#include <exception>

namespace
{
    int set_nonblock(int fd)
    {
        int f = fcntl(fd, F_GETFL, 0);
        return (f >= 0 && fcntl(fd, F_SETFL, f | O_NONBLOCK) >= 0) ? 0 : -1;
    }
} // namespace

HttpServer::HttpServer(const ServerConfig &cfg, SaveApi &api)
    : bind_(cfg.bind), port_(cfg.port), max_body_(cfg.max_body_bytes), api_(api) {}

HttpServer::~HttpServer()
{
    stop();
    wake_clients_();
    wait_idle_();
    int fd = listen_fd_.exchange(-1);
    if (fd >= 0)
        ::close(fd);
}

bool HttpServer::setup_listen_()
{
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        LOG_ERROR("HTTP socket() failed: %s", strerror(errno));
        return false;
    }
    int on = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0)
        LOG_WARN("setsockopt(SO_REUSEADDR) failed: %s", strerror(errno));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port_);
    if (::inet_pton(AF_INET, bind_.c_str(), &addr.sin_addr) <= 0)
    {
        LOG_ERROR("HTTP invalid bind ip: %s", bind_.c_str());
        ::close(fd);
        return false;
    }
    if (::bind(fd, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        LOG_ERROR("HTTP bind() failed on %s:%d: %s", bind_.c_str(), port_, strerror(errno));
        ::close(fd);
        return false;
    }
    if (::listen(fd, 512) < 0)
    {
        LOG_ERROR("HTTP listen() failed: %s", strerror(errno));
        ::close(fd);
        return false;
    }

    sockaddr_in got{};
    socklen_t len = sizeof(got);
    if (::getsockname(fd, (sockaddr *)&got, &len) == 0)
        bound_port_ = ntohs(got.sin_port);
    else
        bound_port_ = port_;

    if (set_nonblock(fd) < 0)
        LOG_WARN("HTTP set_nonblock failed: %s", strerror(errno));
    listen_fd_.store(fd);
    return true;
}

bool HttpServer::start()
{
    stopping_.store(false);
    return setup_listen_();
}

void HttpServer::stop()
{
    stopping_.store(true);
    // 只 shutdown，不 close：fd 由 run()/析构关闭，避免与 accept 竞争
    int fd = listen_fd_.load();
    if (fd >= 0)
        ::shutdown(fd, SHUT_RDWR);
}

void HttpServer::release_client_(int cfd)
{
    std::lock_guard<std::mutex> lk(mu_);
    clients_.erase(cfd);
    ::close(cfd);
    if (--in_flight_ == 0)
        idle_cv_.notify_all();
}

void HttpServer::wake_clients_()
{
    // 还没发完请求的连接 recv 返回 0；已读完请求的照常回包
    std::lock_guard<std::mutex> lk(mu_);
    for (int cfd : clients_)
        ::shutdown(cfd, SHUT_RD);
}

void HttpServer::wait_idle_()
{
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return in_flight_ == 0; });
}

void HttpServer::spawn_worker_(int cfd)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++in_flight_;
        clients_.insert(cfd);
    }
    try
    {
        std::thread([this, cfd] {
            serve_client_(cfd);
            release_client_(cfd);
        }).detach();
    }
    catch (const std::system_error &e)
    {
        LOG_ERROR("HTTP worker thread failed: %s", e.what());
        release_client_(cfd);
    }
}

void HttpServer::serve_client_(int cfd)
{
    HttpRequest req;
    ReadStatus st = read_request(cfd, req, max_body_);
    if (st == ReadStatus::CLOSED)
        return;

    HttpResponse resp;
    if (st != ReadStatus::OK)
    {
        resp = SaveApi::framing_error(st);
        LOG_WARN("HTTP rejected request: %d", resp.code);
    }
    else
    {
        try
        {
            resp = api_.handle(req);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("%s %s failed: %s", req.method.c_str(), req.path.c_str(), e.what());
            resp = SaveApi::internal_error();
        }
        LOG_INFO("%s %s -> %d", req.method.c_str(), req.path.c_str(), resp.code);
    }

    if (!write_response(cfd, resp))
        LOG_WARN("HTTP send failed: %s", strerror(errno));
}

void HttpServer::run()
{
    LOG_INFO("HTTP server listening at http://%s:%d", bind_.c_str(), bound_port_);
    while (!stopping_.load())
    {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int cfd = ::accept4(listen_fd_.load(), (sockaddr *)&cli, &len, SOCK_CLOEXEC);
        if (cfd < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                usleep(1000 * 10);
                continue;
            }
            if (errno == EINTR)
                continue;
            if (stopping_.load())
                break;
            LOG_WARN("HTTP accept error: %s", strerror(errno));
            usleep(1000 * 10);
            continue;
        }
        spawn_worker_(cfd);
    }

    wake_clients_();
    wait_idle_();
    int fd = listen_fd_.exchange(-1);
    if (fd >= 0)
        ::close(fd);
    LOG_INFO("HTTP server stopped.");
}
