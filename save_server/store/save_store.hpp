#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/noncopyable.hpp"

// 存储操作结果（四态），HTTP 层据此映射状态码
enum class StoreStatus : uint8_t
{
    OK = 0,
    NOT_FOUND,
    INVALID,  // 输入非法（空 key、非对象负载），未触碰磁盘
    IO_ERROR  // 底层系统调用失败，error 中带 strerror
};

const char *store_status_str(StoreStatus s);

struct StoreResult
{
    StoreStatus status = StoreStatus::OK;
    std::string error;

    bool ok() const { return status == StoreStatus::OK; }
};

struct LoadResult : StoreResult
{
    nlohmann::json doc;
};

struct RawReadResult : StoreResult
{
    std::string text; // 文件原文，不解析
};

struct SaveFileInfo
{
    std::string name;
    uint64_t size = 0;
    int64_t mtime_ms = 0; // Unix 毫秒
};

struct DiskInfo
{
    std::string path;
    bool exists = false;
    bool is_dir = false;
};

// 每个用户 key 一个文件：root/<key>.json。
// 写入一律先写临时文件 root/<key>.json.<pid>-<seq>.tmp，fsync 后 rename 覆盖，
// 读者只会看到完整的旧内容或完整的新内容。同一 key 的并发写不加锁，最后一次 rename 生效。
class SaveStore : NonCopyable
{
public:
    explicit SaveStore(std::string root);

    // 递归创建目录并做一次探测写（写 .write_probe 再删除）；失败即不可服务
    bool init(std::string &err);

    const std::string &root() const { return root_; }
    std::string final_path(const std::string &key) const; // root/<key>.json

    // null 负载按 {} 保存
    StoreResult save(const std::string &key, const nlohmann::json &payload);
    // 不存在返回 NOT_FOUND（不是错误，调用方当作“无存档”）
    LoadResult load(const std::string &key) const;
    RawReadResult raw_read(const std::string &key) const;
    // 负载必须是对象或数组，否则 INVALID
    StoreResult raw_write(const std::string &key, const nlohmann::json &payload);
    StoreResult remove(const std::string &key);

    StoreResult list_keys(std::vector<std::string> &out) const;
    StoreResult list_files(std::vector<SaveFileInfo> &out) const;
    DiskInfo disk_info() const;

private:
    std::string temp_path_(const std::string &key);
    StoreResult write_atomic_(const std::string &key, const std::string &text);
    StoreResult read_file_(const std::string &key, std::string &text) const;

    std::string root_;
    std::atomic<uint64_t> tmp_seq_{0};
};
