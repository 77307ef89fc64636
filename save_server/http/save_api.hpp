#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "http/http_message.hpp"
#include "store/save_store.hpp"

// 路由表：HttpRequest -> HttpResponse，不碰 socket
class SaveApi
{
public:
    explicit SaveApi(SaveStore &store) : store_(store) {}

    HttpResponse handle(const HttpRequest &req);

    // 解析阶段失败（400/411/413）时的响应，同样带 CORS 头
    static HttpResponse framing_error(ReadStatus st);
    // 处理过程中抛出异常时的 500
    static HttpResponse internal_error();

    static HttpResponse json_reply(int code, const nlohmann::json &j);
    static HttpResponse text_reply(int code, const std::string &body);

private:
    HttpResponse route_(const HttpRequest &req, const std::string &method, const std::string &path);

    HttpResponse handle_save_(const HttpRequest &req);
    HttpResponse handle_load_(const HttpRequest &req);
    HttpResponse handle_raw_read_(const HttpRequest &req);
    HttpResponse handle_raw_write_(const HttpRequest &req);
    HttpResponse handle_raw_delete_(const HttpRequest &req);
    HttpResponse handle_list_();
    HttpResponse handle_files_();
    HttpResponse handle_disk_info_();
    static HttpResponse handle_preflight_(const HttpRequest &req);

    // 取 ?user= 并 sanitize；失败时填好 err（json_errors 决定错误体格式）
    static bool user_key_(const HttpRequest &req, bool json_errors,
                          std::string &key, HttpResponse &err);
    // 仅解析 JSON 类型的请求体；空体或非 JSON 类型得到 null
    static bool decode_body_(const HttpRequest &req, nlohmann::json &out, HttpResponse &err);

    SaveStore &store_;
};

// Unix 毫秒 -> "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso8601_utc(int64_t ms);
