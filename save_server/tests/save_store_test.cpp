#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <set>
#include <atomic>
#include <algorithm>
#include <sys/stat.h>
#include "store/save_store.hpp"
#include "test_utils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

class SaveStoreTest : public ::testing::Test
{
protected:
    TempDir dir;
    std::unique_ptr<SaveStore> store;

    void SetUp() override
    {
        store = std::make_unique<SaveStore>(dir.path());
        std::string err;
        ASSERT_TRUE(store->init(err)) << err;
    }

    static std::string slurp(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::vector<std::string> dir_entries() const
    {
        std::vector<std::string> names;
        for (const auto &e : fs::directory_iterator(dir.path()))
            names.push_back(e.path().filename().string());
        return names;
    }
};

TEST_F(SaveStoreTest, InitCreatesNestedDirectoryAndRemovesProbe)
{
    TempDir outer;
    std::string nested = outer.path() + "/a/b/c";
    SaveStore s(nested);
    std::string err;
    ASSERT_TRUE(s.init(err)) << err;
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_FALSE(fs::exists(nested + "/.write_probe"));
}

TEST_F(SaveStoreTest, InitFailsWhenRootIsAFile)
{
    std::string file = dir.path() + "/not_a_dir";
    std::ofstream(file) << "x";
    SaveStore s(file);
    std::string err;
    EXPECT_FALSE(s.init(err));
    EXPECT_FALSE(err.empty());
}

TEST_F(SaveStoreTest, InitFailsWhenDirectoryIsReadOnly)
{
    if (running_as_root())
        GTEST_SKIP() << "root ignores directory permissions";
    std::string ro = dir.path() + "/ro";
    fs::create_directories(ro);
    ASSERT_EQ(::chmod(ro.c_str(), 0555), 0);
    SaveStore s(ro);
    std::string err;
    EXPECT_FALSE(s.init(err));
    EXPECT_NE(err.find(".write_probe"), std::string::npos);
}

TEST_F(SaveStoreTest, TrailingSlashIsNormalized)
{
    SaveStore s(dir.path() + "//");
    EXPECT_EQ(s.root(), dir.path());
    EXPECT_EQ(s.final_path("bob"), dir.path() + "/bob.json");
}

TEST_F(SaveStoreTest, SaveThenLoadRoundTrips)
{
    json doc = {{"level", 3}, {"inventory", {"sword", "shield"}}, {"pos", {{"x", 1.5}, {"y", -2}}}};
    ASSERT_TRUE(store->save("alice", doc).ok());

    LoadResult r = store->load("alice");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.doc, doc);
}

TEST_F(SaveStoreTest, FileIsPrettyPrintedJson)
{
    json doc = {{"level", 3}};
    ASSERT_TRUE(store->save("alice", doc).ok());
    EXPECT_EQ(slurp(store->final_path("alice")), doc.dump(2));
}

TEST_F(SaveStoreTest, NullPayloadSavesEmptyObject)
{
    ASSERT_TRUE(store->save("empty", json()).ok());
    LoadResult r = store->load("empty");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.doc, json::object());
}

TEST_F(SaveStoreTest, SaveReplacesPreviousContent)
{
    ASSERT_TRUE(store->save("carol", json{{"a", 1}, {"b", 2}}).ok());
    ASSERT_TRUE(store->save("carol", json{{"c", 3}}).ok());

    LoadResult r = store->load("carol");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.doc, (json{{"c", 3}}));
}

TEST_F(SaveStoreTest, LoadMissingIsNotFound)
{
    LoadResult r = store->load("ghost");
    EXPECT_EQ(r.status, StoreStatus::NOT_FOUND);
    EXPECT_TRUE(r.error.empty());
}

TEST_F(SaveStoreTest, LoadCorruptFileIsIoError)
{
    std::ofstream(store->final_path("broken")) << "{\"level\":";
    LoadResult r = store->load("broken");
    EXPECT_EQ(r.status, StoreStatus::IO_ERROR);
    EXPECT_FALSE(r.error.empty());
}

TEST_F(SaveStoreTest, RawReadReturnsFileText)
{
    ASSERT_TRUE(store->save("dave", json{{"hp", 10}}).ok());
    RawReadResult r = store->raw_read("dave");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.text, json({{"hp", 10}}).dump(2));

    EXPECT_EQ(store->raw_read("nobody").status, StoreStatus::NOT_FOUND);
}

TEST_F(SaveStoreTest, RawWriteAcceptsObjectsAndArrays)
{
    EXPECT_TRUE(store->raw_write("obj", json{{"k", "v"}}).ok());
    EXPECT_TRUE(store->raw_write("arr", json::array({1, 2, 3})).ok());
    EXPECT_EQ(store->load("arr").doc, json::array({1, 2, 3}));
}

TEST_F(SaveStoreTest, RawWriteRejectsScalarsBeforeTouchingDisk)
{
    for (const json &bad : {json(), json("not-an-object"), json(42), json(true)})
    {
        StoreResult r = store->raw_write("erin", bad);
        EXPECT_EQ(r.status, StoreStatus::INVALID) << bad.dump();
    }
    EXPECT_TRUE(dir_entries().empty());
}

TEST_F(SaveStoreTest, EmptyKeyIsRejected)
{
    EXPECT_EQ(store->save("", json{{"a", 1}}).status, StoreStatus::INVALID);
    EXPECT_EQ(store->load("").status, StoreStatus::INVALID);
    EXPECT_EQ(store->remove("").status, StoreStatus::INVALID);
    EXPECT_FALSE(fs::exists(dir.path() + "/.json"));
}

TEST_F(SaveStoreTest, UnsanitizedKeyIsRejected)
{
    EXPECT_EQ(store->save("../escape", json{{"a", 1}}).status, StoreStatus::INVALID);
    EXPECT_FALSE(fs::exists(fs::path(dir.path()).parent_path() / "escape.json"));
}

TEST_F(SaveStoreTest, RemoveDeletesDocument)
{
    ASSERT_TRUE(store->save("frank", json{{"x", 1}}).ok());
    EXPECT_TRUE(store->remove("frank").ok());
    EXPECT_EQ(store->load("frank").status, StoreStatus::NOT_FOUND);
}

TEST_F(SaveStoreTest, RemoveMissingIsNotFound)
{
    StoreResult r = store->remove("ghost");
    EXPECT_EQ(r.status, StoreStatus::NOT_FOUND);
}

TEST_F(SaveStoreTest, WriteLeavesNoTempFiles)
{
    ASSERT_TRUE(store->save("gina", json{{"x", 1}}).ok());
    ASSERT_TRUE(store->raw_write("gina", json{{"x", 2}}).ok());
    std::vector<std::string> names = dir_entries();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "gina.json");
}

TEST_F(SaveStoreTest, FailedWriteKeepsOldContent)
{
    if (running_as_root())
        GTEST_SKIP() << "root ignores directory permissions";
    ASSERT_TRUE(store->save("hank", json{{"v", 1}}).ok());
    ASSERT_EQ(::chmod(dir.path().c_str(), 0555), 0);

    StoreResult r = store->save("hank", json{{"v", 2}});
    ::chmod(dir.path().c_str(), 0755);

    EXPECT_EQ(r.status, StoreStatus::IO_ERROR);
    EXPECT_NE(r.error.find("Permission denied"), std::string::npos) << r.error;
    EXPECT_EQ(store->load("hank").doc, (json{{"v", 1}}));
}

TEST_F(SaveStoreTest, WriteOntoDirectoryIsIoError)
{
    fs::create_directories(store->final_path("jack"));

    StoreResult r = store->save("jack", json{{"v", 1}});
    EXPECT_EQ(r.status, StoreStatus::IO_ERROR);
    EXPECT_NE(r.error.find("rename"), std::string::npos) << r.error;
    EXPECT_EQ(store->raw_write("jack", json{{"v", 2}}).status, StoreStatus::IO_ERROR);

    // 临时文件已清理，目录原样保留
    EXPECT_EQ(dir_entries(), std::vector<std::string>{"jack.json"});
    EXPECT_TRUE(fs::is_directory(store->final_path("jack")));
}

TEST_F(SaveStoreTest, ReadAndRemoveDirectoryAreIoErrors)
{
    fs::create_directories(store->final_path("kate"));

    EXPECT_EQ(store->load("kate").status, StoreStatus::IO_ERROR);
    EXPECT_EQ(store->raw_read("kate").status, StoreStatus::IO_ERROR);

    StoreResult r = store->remove("kate");
    EXPECT_EQ(r.status, StoreStatus::IO_ERROR);
    EXPECT_NE(r.error.find("unlink"), std::string::npos) << r.error;
}

TEST_F(SaveStoreTest, ListKeysReturnsSavedKeysOnly)
{
    ASSERT_TRUE(store->save("a", json{{"n", 1}}).ok());
    ASSERT_TRUE(store->save("b", json{{"n", 2}}).ok());
    std::ofstream(dir.path() + "/notes.txt") << "hello";
    std::ofstream(dir.path() + "/b.json.123-0.tmp") << "{";
    std::ofstream(dir.path() + "/.json") << "{}";
    fs::create_directories(dir.path() + "/sub.json");

    std::vector<std::string> keys;
    ASSERT_TRUE(store->list_keys(keys).ok());
    EXPECT_EQ(std::set<std::string>(keys.begin(), keys.end()), (std::set<std::string>{"a", "b"}));
}

TEST_F(SaveStoreTest, ListKeysOnMissingDirectoryFails)
{
    SaveStore s(dir.path() + "/gone");
    std::vector<std::string> keys;
    StoreResult r = s.list_keys(keys);
    EXPECT_EQ(r.status, StoreStatus::IO_ERROR);
    EXPECT_NE(r.error.find("opendir"), std::string::npos);
}

TEST_F(SaveStoreTest, ListFilesReportsEveryRegularFile)
{
    ASSERT_TRUE(store->save("ivy", json{{"n", 1}}).ok());
    std::ofstream(dir.path() + "/readme.txt") << "12345";
    fs::create_directories(dir.path() + "/subdir");

    std::vector<SaveFileInfo> files;
    ASSERT_TRUE(store->list_files(files).ok());
    ASSERT_EQ(files.size(), 2u);

    std::set<std::string> names;
    for (const auto &f : files)
    {
        names.insert(f.name);
        EXPECT_GT(f.mtime_ms, 0);
        if (f.name == "readme.txt")
            EXPECT_EQ(f.size, 5u);
        else
            EXPECT_EQ(f.size, fs::file_size(store->final_path("ivy")));
    }
    EXPECT_EQ(names, (std::set<std::string>{"ivy.json", "readme.txt"}));
}

TEST_F(SaveStoreTest, DiskInfo)
{
    DiskInfo di = store->disk_info();
    EXPECT_EQ(di.path, dir.path());
    EXPECT_TRUE(di.exists);
    EXPECT_TRUE(di.is_dir);

    SaveStore missing(dir.path() + "/nope");
    DiskInfo none = missing.disk_info();
    EXPECT_FALSE(none.exists);
    EXPECT_FALSE(none.is_dir);
}

TEST_F(SaveStoreTest, ConcurrentSavesToSameKeyNeverTear)
{
    const int writers = 8;
    const int rounds = 25;

    // 每个写者的负载都足够大，交错写入一定会破坏 JSON
    std::vector<json> payloads;
    for (int i = 0; i < writers; ++i)
        payloads.push_back(json{{"writer", i}, {"blob", std::string(32 * 1024, (char)('a' + i))}});

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < writers; ++i)
    {
        threads.emplace_back([&, i] {
            for (int j = 0; j < rounds; ++j)
                if (!store->save("shared", payloads[i]).ok())
                    ++failures;
        });
    }

    // 并发读：每次读到的都必须是某个完整负载
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!done.load())
        {
            LoadResult r = store->load("shared");
            if (r.status == StoreStatus::NOT_FOUND)
                continue;
            if (!r.ok() || std::find(payloads.begin(), payloads.end(), r.doc) == payloads.end())
                ++torn;
        }
    });

    for (auto &t : threads)
        t.join();
    done.store(true);
    reader.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(torn.load(), 0);

    LoadResult final_doc = store->load("shared");
    ASSERT_TRUE(final_doc.ok());
    EXPECT_NE(std::find(payloads.begin(), payloads.end(), final_doc.doc), payloads.end());

    std::vector<std::string> names = dir_entries();
    EXPECT_EQ(names, std::vector<std::string>{"shared.json"});
}

TEST_F(SaveStoreTest, ConcurrentSavesToDistinctKeys)
{
    const int threads_n = 6;
    const int per_thread = 20;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < threads_n; ++i)
    {
        threads.emplace_back([&, i] {
            for (int j = 0; j < per_thread; ++j)
            {
                std::string key = "user_" + std::to_string(i) + "_" + std::to_string(j);
                json doc{{"i", i}, {"j", j}};
                if (store->save(key, doc).ok() && store->load(key).doc == doc)
                    ++ok;
            }
        });
    }
    for (auto &t : threads)
        t.join();
    EXPECT_EQ(ok.load(), threads_n * per_thread);

    std::vector<std::string> keys;
    ASSERT_TRUE(store->list_keys(keys).ok());
    EXPECT_EQ(keys.size(), (size_t)(threads_n * per_thread));
}
