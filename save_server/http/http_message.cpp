#include "http/http_message.hpp"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <algorithm>

namespace
{
    std::string to_lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }

    std::string trim(const std::string &s)
    {
        size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t'))
            ++b;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r'))
            --e;
        return s.substr(b, e - b);
    }

    int hex_val(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    ssize_t read_n(int fd, char *buf, size_t n)
    {
        size_t got = 0;
        while (got < n)
        {
            ssize_t r = ::recv(fd, buf + got, n - got, 0);
            if (r > 0)
                got += (size_t)r;
            else if (r == 0)
                break;
            else if (errno == EINTR)
                continue;
            else
                return -1;
        }
        return (ssize_t)got;
    }

    bool send_all(int fd, const char *data, size_t n)
    {
        size_t sent = 0;
        while (sent < n)
        {
            ssize_t w = ::send(fd, data + sent, n - sent, MSG_NOSIGNAL);
            if (w > 0)
                sent += (size_t)w;
            else if (w < 0 && errno == EINTR)
                continue;
            else
                return false;
        }
        return true;
    }
} // namespace

bool HttpRequest::get_query(const std::string &key, std::string &val) const
{
    for (const auto &kv : query)
    {
        if (kv.first == key)
        {
            val = kv.second;
            return true;
        }
    }
    val.clear();
    return false;
}

bool HttpRequest::get_header(const std::string &key, std::string &val) const
{
    const std::string k = to_lower(key);
    for (const auto &kv : headers)
    {
        if (kv.first == k)
        {
            val = kv.second;
            return true;
        }
    }
    val.clear();
    return false;
}

void HttpResponse::set_header(const std::string &name, const std::string &value)
{
    for (auto &kv : headers)
    {
        if (to_lower(kv.first) == to_lower(name))
        {
            kv.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

const char *http_status_text(int code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 411:
        return "Length Required";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    }
    return "Unknown";
}

std::string url_decode(const std::string &s, bool plus_as_space)
{
    std::string o;
    o.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size())
        {
            int hi = hex_val(s[i + 1]);
            int lo = hex_val(s[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                o.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
            o.push_back(s[i]);
        }
        else if (plus_as_space && s[i] == '+')
            o.push_back(' ');
        else
            o.push_back(s[i]);
    }
    return o;
}

void split_target(const std::string &target, std::string &path,
                  std::vector<std::pair<std::string, std::string>> &query)
{
    query.clear();
    auto qpos = target.find('?');
    path = url_decode(target.substr(0, qpos), false);
    if (qpos == std::string::npos)
        return;

    std::string qs = target.substr(qpos + 1);
    auto hash = qs.find('#');
    if (hash != std::string::npos)
        qs.erase(hash);
    size_t start = 0;
    while (start <= qs.size())
    {
        auto amp = qs.find('&', start);
        std::string kv = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!kv.empty())
        {
            auto eq = kv.find('=');
            std::string k = url_decode(eq == std::string::npos ? kv : kv.substr(0, eq));
            std::string v = (eq == std::string::npos) ? "" : url_decode(kv.substr(eq + 1));
            query.emplace_back(std::move(k), std::move(v));
        }
        if (amp == std::string::npos)
            break;
        start = amp + 1;
    }
}

bool parse_head(const std::string &head, HttpRequest &req)
{
    req.method.clear();
    req.target.clear();
    req.path.clear();
    req.query.clear();
    req.headers.clear();

    size_t eol = head.find("\r\n");
    std::string first = head.substr(0, eol);
    {
        auto p1 = first.find(' ');
        if (p1 == std::string::npos)
            return false;
        auto p2 = first.find(' ', p1 + 1);
        if (p2 == std::string::npos || p2 == p1 + 1)
            return false;
        if (first.compare(p2 + 1, 5, "HTTP/") != 0)
            return false;
        req.method = first.substr(0, p1);
        req.target = first.substr(p1 + 1, p2 - p1 - 1);
    }
    if (req.method.empty() || req.target.empty())
        return false;
    split_target(req.target, req.path, req.query);

    size_t pos = (eol == std::string::npos) ? head.size() : eol + 2;
    while (pos < head.size())
    {
        size_t end = head.find("\r\n", pos);
        if (end == std::string::npos)
            end = head.size();
        std::string line = head.substr(pos, end - pos);
        pos = end + 2;
        if (line.empty())
            continue;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
            return false;
        req.headers.emplace_back(to_lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
    }
    return true;
}

ReadStatus read_request(int fd, HttpRequest &req, size_t max_body)
{
    req.body.clear();

    // 读到包含 "\r\n\r\n" 为止（可多次）
    std::string buf;
    char tmp[4096];
    size_t hdr_end = std::string::npos;
    for (;;)
    {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return buf.empty() ? ReadStatus::CLOSED : ReadStatus::BAD_REQUEST;
        buf.append(tmp, (size_t)n);
        hdr_end = buf.find("\r\n\r\n");
        if (hdr_end != std::string::npos)
            break;
        if (buf.size() > MAX_HEADER_BYTES)
            return ReadStatus::BAD_REQUEST;
    }
    if (hdr_end > MAX_HEADER_BYTES)
        return ReadStatus::BAD_REQUEST;

    if (!parse_head(buf.substr(0, hdr_end), req))
        return ReadStatus::BAD_REQUEST;
    // header 之后已读到的部分是 body 前缀
    req.body = buf.substr(hdr_end + 4);

    std::string te;
    if (req.get_header("Transfer-Encoding", te) && !te.empty())
        return ReadStatus::LENGTH_REQUIRED;

    std::string clen_s;
    if (!req.get_header("Content-Length", clen_s))
    {
        req.body.clear();
        return ReadStatus::OK;
    }
    if (clen_s.empty() || !std::all_of(clen_s.begin(), clen_s.end(),
                                        [](unsigned char c) { return std::isdigit(c); }))
        return ReadStatus::BAD_REQUEST;
    if (clen_s.size() > 18)
        return ReadStatus::TOO_LARGE;
    size_t clen = (size_t)std::strtoull(clen_s.c_str(), nullptr, 10);
    if (clen > max_body)
        return ReadStatus::TOO_LARGE;

    if (req.body.size() < clen)
    {
        size_t have = req.body.size();
        req.body.resize(clen);
        ssize_t r = read_n(fd, &req.body[have], clen - have);
        if (r != (ssize_t)(clen - have))
            return ReadStatus::CLOSED;
    }
    else if (req.body.size() > clen)
    {
        // pipeline 的多余字节不处理（每个连接只服务一个请求）
        req.body.resize(clen);
    }
    return ReadStatus::OK;
}

std::string serialize_response(const HttpResponse &resp)
{
    char line[128];
    std::snprintf(line, sizeof(line), "HTTP/1.1 %d %s\r\n", resp.code, http_status_text(resp.code));
    std::string out = line;
    if (resp.code != 204)
    {
        out += "Content-Type: " + resp.content_type + "\r\n";
        out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    }
    for (const auto &kv : resp.headers)
        out += kv.first + ": " + kv.second + "\r\n";
    out += "Connection: close\r\n\r\n";
    if (!resp.head_only && resp.code != 204)
        out += resp.body;
    return out;
}

bool write_response(int fd, const HttpResponse &resp)
{
    const std::string wire = serialize_response(resp);
    return send_all(fd, wire.data(), wire.size());
}
