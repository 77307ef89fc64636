#include "http/save_api.hpp"
#include "store/user_key.hpp"
#include "common/logger.hpp"

#include <ctime>
#include <cstdio>
#include <cctype>
#include <algorithm>

using json = nlohmann::json;

namespace
{
    const char *kJsonType = "application/json; charset=utf-8";

    std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }

    // 路由不区分大小写，忽略末尾的一个 '/'
    std::string normalize_path(const std::string &path)
    {
        std::string p = lower(path);
        if (p.size() > 1 && p.back() == '/')
            p.pop_back();
        return p;
    }

    void add_cors(HttpResponse &resp)
    {
        resp.set_header("Access-Control-Allow-Origin", "*");
    }

    json error_body(const std::string &msg)
    {
        return json{{"error", msg}};
    }
} // namespace

std::string iso8601_utc(int64_t ms)
{
    int64_t secs = ms / 1000;
    int64_t rem = ms % 1000;
    if (rem < 0)
    {
        rem += 1000;
        --secs;
    }
    std::time_t t = (std::time_t)secs;
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)rem);
    return buf;
}

HttpResponse SaveApi::json_reply(int code, const json &j)
{
    HttpResponse r;
    r.code = code;
    // 目录里可能有非 UTF-8 的文件名，替换而不是抛异常
    r.body = j.dump(-1, ' ', false, json::error_handler_t::replace);
    r.content_type = kJsonType;
    return r;
}

HttpResponse SaveApi::text_reply(int code, const std::string &body)
{
    HttpResponse r;
    r.code = code;
    r.body = body;
    return r;
}

HttpResponse SaveApi::framing_error(ReadStatus st)
{
    HttpResponse r;
    switch (st)
    {
    case ReadStatus::TOO_LARGE:
        r = json_reply(413, error_body("Payload too large"));
        break;
    case ReadStatus::LENGTH_REQUIRED:
        r = json_reply(411, error_body("Content-Length required"));
        break;
    default:
        r = json_reply(400, error_body("Bad request"));
        break;
    }
    add_cors(r);
    return r;
}

HttpResponse SaveApi::internal_error()
{
    HttpResponse r = json_reply(500, error_body("Internal server error"));
    add_cors(r);
    return r;
}

HttpResponse SaveApi::handle(const HttpRequest &req)
{
    std::string method = req.method;
    const bool head = (method == "HEAD");
    if (head)
        method = "GET";

    HttpResponse resp = route_(req, method, normalize_path(req.path));
    resp.head_only = head;
    add_cors(resp);
    return resp;
}

HttpResponse SaveApi::route_(const HttpRequest &req, const std::string &method, const std::string &path)
{
    if (method == "OPTIONS")
        return handle_preflight_(req);

    if (path == "/api/ping" && method == "GET")
        return json_reply(200, json{{"status", "ok"}});

    if (path == "/api/game/save" && method == "POST")
        return handle_save_(req);
    if (path == "/api/game/load" && method == "GET")
        return handle_load_(req);

    if (path == "/api/game/rawsave")
    {
        if (method == "GET")
            return handle_raw_read_(req);
        if (method == "PUT")
            return handle_raw_write_(req);
        if (method == "DELETE")
            return handle_raw_delete_(req);
    }

    if (method == "GET")
    {
        if (path == "/api/game/list")
            return handle_list_();
        if (path == "/api/game/files")
            return handle_files_();
        if (path == "/api/game/disk-info")
            return handle_disk_info_();
    }

    return text_reply(404, "Not Found");
}

bool SaveApi::user_key_(const HttpRequest &req, bool json_errors,
                        std::string &key, HttpResponse &err)
{
    std::string raw;
    if (!req.get_query("user", raw) || raw.empty())
    {
        err = json_errors ? json_reply(400, error_body("Missing user"))
                          : text_reply(400, "Missing user");
        return false;
    }
    key = sanitize_user_key(raw);
    if (key.empty())
    {
        err = json_errors ? json_reply(400, error_body("Invalid user"))
                          : text_reply(400, "Invalid user");
        return false;
    }
    return true;
}

bool SaveApi::decode_body_(const HttpRequest &req, json &out, HttpResponse &err)
{
    out = nullptr;
    if (req.body.empty())
        return true;

    std::string ctype;
    if (req.get_header("Content-Type", ctype) && lower(ctype).find("json") == std::string::npos)
    {
        LOG_DEBUG("ignoring body with content-type %s", ctype.c_str());
        return true;
    }

    try
    {
        out = json::parse(req.body);
    }
    catch (const json::parse_error &e)
    {
        LOG_WARN("bad json body: %s", e.what());
        err = json_reply(400, error_body("Invalid JSON body"));
        return false;
    }
    return true;
}

HttpResponse SaveApi::handle_save_(const HttpRequest &req)
{
    std::string key;
    HttpResponse err;
    if (!user_key_(req, false, key, err))
        return err;
    json payload;
    if (!decode_body_(req, payload, err))
        return err;

    StoreResult r = store_.save(key, payload);
    if (!r.ok())
    {
        LOG_ERROR("save error user=%s: %s", key.c_str(), r.error.c_str());
        return text_reply(500, "Save failed");
    }
    return text_reply(200, "OK");
}

HttpResponse SaveApi::handle_load_(const HttpRequest &req)
{
    std::string key;
    HttpResponse err;
    if (!user_key_(req, false, key, err))
        return err;

    LoadResult r = store_.load(key);
    if (r.status == StoreStatus::NOT_FOUND)
        return json_reply(200, nullptr);
    if (!r.ok())
    {
        LOG_ERROR("load error user=%s: %s", key.c_str(), r.error.c_str());
        return text_reply(500, "Read failed");
    }
    return json_reply(200, r.doc);
}

HttpResponse SaveApi::handle_raw_read_(const HttpRequest &req)
{
    std::string key;
    HttpResponse err;
    if (!user_key_(req, true, key, err))
        return err;

    RawReadResult r = store_.raw_read(key);
    if (!r.ok())
    {
        if (r.status == StoreStatus::IO_ERROR)
            LOG_ERROR("rawsave read error user=%s: %s", key.c_str(), r.error.c_str());
        return json_reply(404, error_body("Save not found"));
    }
    HttpResponse resp = text_reply(200, r.text);
    resp.content_type = kJsonType;
    return resp;
}

HttpResponse SaveApi::handle_raw_write_(const HttpRequest &req)
{
    std::string key;
    HttpResponse err;
    if (!user_key_(req, true, key, err))
        return err;
    json payload;
    if (!decode_body_(req, payload, err))
        return err;

    StoreResult r = store_.raw_write(key, payload);
    switch (r.status)
    {
    case StoreStatus::OK:
        return json_reply(200, json{{"ok", true}, {"message", "Save file updated."}});
    case StoreStatus::INVALID:
        return json_reply(400, error_body("Missing or invalid data"));
    default:
        LOG_ERROR("rawsave write error user=%s: %s", key.c_str(), r.error.c_str());
        return json_reply(500, error_body(r.error));
    }
}

HttpResponse SaveApi::handle_raw_delete_(const HttpRequest &req)
{
    std::string key;
    HttpResponse err;
    if (!user_key_(req, true, key, err))
        return err;

    StoreResult r = store_.remove(key);
    switch (r.status)
    {
    case StoreStatus::OK:
        return json_reply(200, json{{"ok", true}, {"message", "Save file deleted."}});
    case StoreStatus::NOT_FOUND:
        return json_reply(404, error_body("Save file not found"));
    default:
        LOG_ERROR("delete error user=%s: %s", key.c_str(), r.error.c_str());
        return json_reply(500, error_body(r.error));
    }
}

HttpResponse SaveApi::handle_list_()
{
    std::vector<std::string> keys;
    StoreResult r = store_.list_keys(keys);
    if (!r.ok())
        return json_reply(500, error_body("Failed to read save directory"));
    return json_reply(200, keys);
}

HttpResponse SaveApi::handle_files_()
{
    std::vector<SaveFileInfo> files;
    StoreResult r = store_.list_files(files);
    if (!r.ok())
        return json_reply(500, error_body("Failed to read save directory"));

    json arr = json::array();
    for (const auto &f : files)
        arr.push_back(json{{"name", f.name}, {"size", f.size}, {"mtime", iso8601_utc(f.mtime_ms)}});
    return json_reply(200, arr);
}

HttpResponse SaveApi::handle_disk_info_()
{
    DiskInfo di = store_.disk_info();
    json j{{"saveDir", di.path}, {"exists", di.exists}};
    if (di.exists)
        j["isDir"] = di.is_dir;
    return json_reply(200, j);
}

HttpResponse SaveApi::handle_preflight_(const HttpRequest &req)
{
    HttpResponse r;
    r.code = 204;
    r.set_header("Access-Control-Allow-Methods", "GET,HEAD,PUT,PATCH,POST,DELETE");
    std::string want;
    if (req.get_header("Access-Control-Request-Headers", want) && !want.empty())
    {
        r.set_header("Access-Control-Allow-Headers", want);
        r.set_header("Vary", "Access-Control-Request-Headers");
    }
    r.set_header("Content-Length", "0");
    return r;
}
