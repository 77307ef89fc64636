#include "store/save_store.hpp"
#include "store/user_key.hpp"
#include "common/logger.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <chrono>

using json = nlohmann::json;

namespace
{
    const char *kJsonExt = ".json";
    const size_t kJsonExtLen = 5;

    std::string sys_error(const char *op, const std::string &path, int err)
    {
        return std::string(op) + " " + path + ": " + std::strerror(err);
    }

    bool ensure_dir(const std::string &dir, int &err)
    {
        struct stat st{};
        if (::stat(dir.c_str(), &st) == 0)
        {
            if (S_ISDIR(st.st_mode))
                return true;
            err = ENOTDIR;
            return false;
        }
        // 递归创建
        auto pos = dir.find_last_of('/');
        if (pos != std::string::npos && pos > 0)
        {
            std::string parent = dir.substr(0, pos);
            if (!ensure_dir(parent, err))
                return false;
        }
        if (::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST)
            return true;
        err = errno;
        return false;
    }

    bool write_all(int fd, const char *data, size_t n)
    {
        size_t done = 0;
        while (done < n)
        {
            ssize_t w = ::write(fd, data + done, n - done);
            if (w > 0)
                done += (size_t)w;
            else if (w < 0 && errno == EINTR)
                continue;
            else
            {
                if (w == 0)
                    errno = EIO;
                return false;
            }
        }
        return true;
    }

    bool ends_with_json(const std::string &name)
    {
        return name.size() >= kJsonExtLen &&
               name.compare(name.size() - kJsonExtLen, kJsonExtLen, kJsonExt) == 0;
    }

    int64_t mtime_ms_of(const struct stat &st)
    {
        return (int64_t)st.st_mtim.tv_sec * 1000 + st.st_mtim.tv_nsec / 1000000;
    }

    StoreResult fail(StoreStatus s, std::string msg)
    {
        StoreResult r;
        r.status = s;
        r.error = std::move(msg);
        return r;
    }

    // 遍历 root 下的普通文件（不跟随符号链接）
    template <typename Fn>
    StoreResult for_each_file(const std::string &root, Fn fn)
    {
        DIR *d = ::opendir(root.c_str());
        if (!d)
        {
            int e = errno;
            LOG_ERROR("opendir %s failed: %s", root.c_str(), std::strerror(e));
            return fail(StoreStatus::IO_ERROR, sys_error("opendir", root, e));
        }
        errno = 0;
        while (struct dirent *ent = ::readdir(d))
        {
            std::string name = ent->d_name;
            if (name == "." || name == "..")
                continue;
            struct stat st{};
            if (::lstat((root + "/" + name).c_str(), &st) != 0)
            {
                // 遍历期间被删除（例如临时文件已 rename），跳过
                errno = 0;
                continue;
            }
            if (S_ISREG(st.st_mode))
                fn(name, st);
            errno = 0;
        }
        int e = errno;
        ::closedir(d);
        if (e != 0)
        {
            LOG_ERROR("readdir %s failed: %s", root.c_str(), std::strerror(e));
            return fail(StoreStatus::IO_ERROR, sys_error("readdir", root, e));
        }
        return StoreResult{};
    }
} // namespace

const char *store_status_str(StoreStatus s)
{
    switch (s)
    {
    case StoreStatus::OK:
        return "ok";
    case StoreStatus::NOT_FOUND:
        return "not found";
    case StoreStatus::INVALID:
        return "invalid";
    case StoreStatus::IO_ERROR:
        return "io error";
    }
    return "unknown";
}

SaveStore::SaveStore(std::string root) : root_(std::move(root))
{
    while (root_.size() > 1 && root_.back() == '/')
        root_.pop_back();
    if (root_.empty())
        root_ = ".";
}

bool SaveStore::init(std::string &err)
{
    err.clear();
    int e = 0;
    if (!ensure_dir(root_, e))
    {
        err = sys_error("mkdir", root_, e);
        return false;
    }

    // 探测写：确认目录真的可写
    std::string probe = root_ + "/.write_probe";
    int fd = ::open(probe.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        err = sys_error("open", probe, errno);
        return false;
    }
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::string stamp = std::to_string((long long)now_ms);
    bool wrote = write_all(fd, stamp.data(), stamp.size());
    int werr = errno;
    if (::close(fd) != 0 && wrote)
    {
        wrote = false;
        werr = errno;
    }
    if (!wrote)
    {
        err = sys_error("write", probe, werr);
        ::unlink(probe.c_str());
        return false;
    }
    if (::unlink(probe.c_str()) != 0)
        LOG_WARN("probe cleanup failed: %s", sys_error("unlink", probe, errno).c_str());

    LOG_INFO("using save directory: %s", root_.c_str());
    return true;
}

std::string SaveStore::final_path(const std::string &key) const
{
    return root_ + "/" + key + kJsonExt;
}

std::string SaveStore::temp_path_(const std::string &key)
{
    uint64_t seq = tmp_seq_.fetch_add(1, std::memory_order_relaxed);
    return final_path(key) + "." + std::to_string((long)::getpid()) + "-" +
           std::to_string((unsigned long long)seq) + ".tmp";
}

StoreResult SaveStore::write_atomic_(const std::string &key, const std::string &text)
{
    const std::string fin = final_path(key);
    const std::string tmp = temp_path_(key);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        int e = errno;
        LOG_ERROR("open temp %s failed: %s", tmp.c_str(), std::strerror(e));
        return fail(StoreStatus::IO_ERROR, sys_error("open", tmp, e));
    }

    const char *op = nullptr;
    if (!write_all(fd, text.data(), text.size()))
        op = "write";
    else if (::fsync(fd) != 0)
        op = "fsync";
    int e = op ? errno : 0;
    if (::close(fd) != 0 && !op)
    {
        op = "close";
        e = errno;
    }
    if (op)
    {
        LOG_ERROR("%s %s failed: %s", op, tmp.c_str(), std::strerror(e));
        ::unlink(tmp.c_str());
        return fail(StoreStatus::IO_ERROR, sys_error(op, tmp, e));
    }

    // 提交点：同一文件系统内 rename 是原子的
    if (::rename(tmp.c_str(), fin.c_str()) != 0)
    {
        e = errno;
        LOG_ERROR("rename %s -> %s failed: %s", tmp.c_str(), fin.c_str(), std::strerror(e));
        ::unlink(tmp.c_str());
        return fail(StoreStatus::IO_ERROR, sys_error("rename", fin, e));
    }
    LOG_DEBUG("committed %s (%zu bytes)", fin.c_str(), text.size());
    return StoreResult{};
}

StoreResult SaveStore::read_file_(const std::string &key, std::string &text) const
{
    text.clear();
    const std::string fin = final_path(key);
    int fd = ::open(fin.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        int e = errno;
        if (e == ENOENT)
            return fail(StoreStatus::NOT_FOUND, "");
        LOG_ERROR("open %s failed: %s", fin.c_str(), std::strerror(e));
        return fail(StoreStatus::IO_ERROR, sys_error("open", fin, e));
    }

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0)
        text.reserve((size_t)st.st_size);

    char buf[64 * 1024];
    for (;;)
    {
        ssize_t r = ::read(fd, buf, sizeof(buf));
        if (r > 0)
            text.append(buf, (size_t)r);
        else if (r == 0)
            break;
        else if (errno == EINTR)
            continue;
        else
        {
            int e = errno;
            ::close(fd);
            LOG_ERROR("read %s failed: %s", fin.c_str(), std::strerror(e));
            return fail(StoreStatus::IO_ERROR, sys_error("read", fin, e));
        }
    }
    ::close(fd);
    return StoreResult{};
}

StoreResult SaveStore::save(const std::string &key, const json &payload)
{
    LOG_DEBUG("save key=%s", key.c_str());
    if (!is_valid_user_key(key))
        return fail(StoreStatus::INVALID, "invalid user key");
    const json &doc = payload.is_null() ? json::object() : payload;
    return write_atomic_(key, doc.dump(2));
}

LoadResult SaveStore::load(const std::string &key) const
{
    LOG_DEBUG("load key=%s", key.c_str());
    LoadResult out;
    if (!is_valid_user_key(key))
    {
        out.status = StoreStatus::INVALID;
        out.error = "invalid user key";
        return out;
    }

    std::string text;
    StoreResult r = read_file_(key, text);
    if (!r.ok())
    {
        static_cast<StoreResult &>(out) = std::move(r);
        return out;
    }
    try
    {
        out.doc = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        LOG_ERROR("parse %s failed: %s", final_path(key).c_str(), e.what());
        out.status = StoreStatus::IO_ERROR;
        out.error = "parse " + final_path(key) + ": " + e.what();
    }
    return out;
}

RawReadResult SaveStore::raw_read(const std::string &key) const
{
    LOG_DEBUG("raw_read key=%s", key.c_str());
    RawReadResult out;
    if (!is_valid_user_key(key))
    {
        out.status = StoreStatus::INVALID;
        out.error = "invalid user key";
        return out;
    }
    static_cast<StoreResult &>(out) = read_file_(key, out.text);
    return out;
}

StoreResult SaveStore::raw_write(const std::string &key, const json &payload)
{
    LOG_DEBUG("raw_write key=%s", key.c_str());
    if (!is_valid_user_key(key))
        return fail(StoreStatus::INVALID, "invalid user key");
    if (!payload.is_object() && !payload.is_array())
        return fail(StoreStatus::INVALID, "payload must be a JSON object");
    return write_atomic_(key, payload.dump(2));
}

StoreResult SaveStore::remove(const std::string &key)
{
    LOG_DEBUG("remove key=%s", key.c_str());
    if (!is_valid_user_key(key))
        return fail(StoreStatus::INVALID, "invalid user key");

    const std::string fin = final_path(key);
    if (::unlink(fin.c_str()) != 0)
    {
        int e = errno;
        if (e == ENOENT)
            return fail(StoreStatus::NOT_FOUND, "");
        LOG_ERROR("unlink %s failed: %s", fin.c_str(), std::strerror(e));
        return fail(StoreStatus::IO_ERROR, sys_error("unlink", fin, e));
    }
    return StoreResult{};
}

StoreResult SaveStore::list_keys(std::vector<std::string> &out) const
{
    out.clear();
    return for_each_file(root_, [&](const std::string &name, const struct stat &) {
        if (!ends_with_json(name))
            return;
        std::string key = name.substr(0, name.size() - kJsonExtLen);
        if (is_valid_user_key(key))
            out.push_back(std::move(key));
    });
}

StoreResult SaveStore::list_files(std::vector<SaveFileInfo> &out) const
{
    out.clear();
    return for_each_file(root_, [&](const std::string &name, const struct stat &st) {
        SaveFileInfo fi;
        fi.name = name;
        fi.size = (uint64_t)st.st_size;
        fi.mtime_ms = mtime_ms_of(st);
        out.push_back(std::move(fi));
    });
}

DiskInfo SaveStore::disk_info() const
{
    DiskInfo di;
    di.path = root_;
    struct stat st{};
    if (::stat(root_.c_str(), &st) == 0)
    {
        di.exists = true;
        di.is_dir = S_ISDIR(st.st_mode);
    }
    return di;
}
