#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstddef>

struct HttpRequest
{
    std::string method;
    std::string target; // 原始 URI（含查询串）
    std::string path;   // 已去掉查询串
    std::vector<std::pair<std::string, std::string>> query;   // 已 URL 解码，保持顺序
    std::vector<std::pair<std::string, std::string>> headers; // 名字统一小写
    std::string body;

    // 取第一次出现的值
    bool get_query(const std::string &key, std::string &val) const;
    bool get_header(const std::string &key, std::string &val) const; // key 大小写不敏感
};

struct HttpResponse
{
    int code = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::vector<std::pair<std::string, std::string>> headers;
    bool head_only = false; // HEAD：只发头，Content-Length 仍按 body 计算

    void set_header(const std::string &name, const std::string &value);
};

enum class ReadStatus
{
    OK = 0,
    CLOSED,          // 对端关闭或读错误，直接断开
    BAD_REQUEST,     // 400
    LENGTH_REQUIRED, // 411（chunked 等无 Content-Length 的请求体）
    TOO_LARGE        // 413
};

static constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

const char *http_status_text(int code);

// %xx 解码；plus_as_space 时把 + 当空格（查询串）
std::string url_decode(const std::string &s, bool plus_as_space = true);

// 解析 "path?k=v&k2=v2"
void split_target(const std::string &target, std::string &path,
                  std::vector<std::pair<std::string, std::string>> &query);

// 从阻塞 fd 读一个完整请求；body 超过 max_body 返回 TOO_LARGE（不读 body）
ReadStatus read_request(int fd, HttpRequest &req, size_t max_body);

// 只解析头部块（含首行，不含结尾空行）
bool parse_head(const std::string &head, HttpRequest &req);

std::string serialize_response(const HttpResponse &resp);
bool write_response(int fd, const HttpResponse &resp);
