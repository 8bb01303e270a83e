#include <filesystem>
#include <fstream>
#include <atomic>
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <sstream>
#include <thread>
#include <unistd.h>

#include <FileJsonStorage.hpp>
#include <TaskRepository.hpp>

using namespace NTaskList;
namespace fs = std::filesystem;

namespace {

    class TempDir {
    public:
        TempDir() {
            std::random_device rd;
            Path = fs::temp_directory_path() / ("tasklist-test-" + std::to_string(rd()) + "-" + std::to_string(::getpid()));
            fs::create_directories(Path);
        }

        ~TempDir() {
            std::error_code ec;
            fs::permissions(Path, fs::perms::owner_all, fs::perm_options::add, ec);
            fs::remove_all(Path, ec);
        }

        fs::path Path;
    };

    std::string ReadFile(const fs::path& p) {
        std::ifstream ifs(p);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    void WriteFile(const fs::path& p, const std::string& content) {
        std::ofstream ofs(p, std::ios::trunc);
        ofs << content;
    }

    TTaskPatch Titled(const std::string& title) {
        TTaskPatch p;
        p.Title = title;
        return p;
    }

} // namespace

TEST(FileStorage, MissingFileIsEmpty) {
    TempDir dir;
    TFileJsonStorage storage(dir.Path / "tasks.json");

    EXPECT_TRUE(storage.LoadTasks().empty());
    EXPECT_FALSE(fs::exists(dir.Path / "tasks.json"));
}

TEST(FileStorage, SaveCreatesMissingDirectories) {
    TempDir dir;
    auto path = dir.Path / "nested" / "deeper" / "tasks.json";
    TFileJsonStorage storage(path);

    TTask t;
    t.Id = 1;
    t.Title = "Buy milk";
    storage.SaveTasks({t});

    ASSERT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path.string() + ".tmp"));

    auto loaded = storage.LoadTasks();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].Id, 1u);
    EXPECT_EQ(loaded[0].Title, "Buy milk");
    EXPECT_FALSE(loaded[0].Completed);
}

TEST(FileStorage, FileIsJsonArrayInInsertionOrder) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    auto storage = std::make_shared<TFileJsonStorage>(path);
    TTaskRepository repo(storage);

    repo.Create(Titled("Buy milk"));
    repo.Create(Titled("Walk dog"));

    auto j = json::parse(ReadFile(path));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0].at("id").get<int>(), 1);
    EXPECT_EQ(j[0].at("title").get<std::string>(), "Buy milk");
    EXPECT_EQ(j[0].at("completed").get<bool>(), false);
    EXPECT_EQ(j[1].at("id").get<int>(), 2);
    EXPECT_FALSE(j[0].contains("priority"));
}

TEST(FileStorage, SaveOfLoadIsIdempotent) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    WriteFile(path, R"([
        {"id": 4, "title": "a", "completed": true, "priority": "high", "due": "soon"},
        {"id": 2, "title": "b", "completed": false, "category": "work", "tags": ["x", "y"]}
    ])");
    TFileJsonStorage storage(path);

    storage.SaveTasks(storage.LoadTasks());
    auto first = ReadFile(path);
    storage.SaveTasks(storage.LoadTasks());
    auto second = ReadFile(path);

    EXPECT_EQ(first, second);

    auto loaded = storage.LoadTasks();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].Id, 4u);
    EXPECT_EQ(loaded[0].Extra.at("due").get<std::string>(), "soon");
    EXPECT_EQ(loaded[1].Category, std::optional<std::string>("work"));
    EXPECT_EQ(loaded[1].Extra.at("tags").size(), 2u);
}

TEST(FileStorage, InvalidJsonIsCorrupt) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    WriteFile(path, "[{\"id\": 1, \"title\": ");
    TFileJsonStorage storage(path);

    EXPECT_THROW(storage.LoadTasks(), TCorruptStoreError);
}

TEST(FileStorage, EmptyFileIsCorrupt) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    WriteFile(path, "");
    TFileJsonStorage storage(path);

    EXPECT_THROW(storage.LoadTasks(), TCorruptStoreError);
}

TEST(FileStorage, NonArrayIsCorrupt) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    WriteFile(path, R"({"tasks": []})");
    TFileJsonStorage storage(path);

    EXPECT_THROW(storage.LoadTasks(), TCorruptStoreError);
}

TEST(FileStorage, BadEntriesAreCorrupt) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    TFileJsonStorage storage(path);

    const char* bad[] = {
        R"([{"title": "no id", "completed": false}])",
        R"([{"id": 0, "title": "zero", "completed": false}])",
        R"([{"id": -3, "title": "negative", "completed": false}])",
        R"([{"id": "1", "title": "string id", "completed": false}])",
        R"([{"id": 1, "completed": false}])",
        R"([{"id": 1, "title": "x", "completed": "no"}])",
        R"([{"id": 1, "title": "x", "completed": false, "priority": "urgent"}])",
        R"([{"id": 1, "title": "x", "completed": false, "category": 5}])",
        R"([{"id": 1, "title": "a", "completed": false}, {"id": 1, "title": "b", "completed": false}])",
        R"([42])",
        R"([] trailing)",
        R"([{"id": 1, "title": "a", "completed": false}] GARBAGE {{{)",
        R"([] [])",
    };
    for (const char* content : bad) {
        WriteFile(path, content);
        EXPECT_THROW(storage.LoadTasks(), TCorruptStoreError) << content;
    }
}

TEST(FileStorage, CorruptFileIsNeverOverwritten) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    auto storage = std::make_shared<TFileJsonStorage>(path);
    TTaskRepository repo(storage);

    const char* corrupt[] = {
        "not json",
        "[] trailing",
        R"([{"id": 1, "title": "a", "completed": false}] GARBAGE {{{)",
    };
    for (const char* content : corrupt) {
        WriteFile(path, content);
        EXPECT_THROW(repo.Create(Titled("x")), TCorruptStoreError) << content;
        EXPECT_THROW(repo.Update(1, Titled("x")), TCorruptStoreError) << content;
        EXPECT_THROW(repo.Delete(1), TCorruptStoreError) << content;
        EXPECT_EQ(ReadFile(path), content);
    }
}

TEST(FileStorage, UpdateMissIsByteIdentical) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    auto storage = std::make_shared<TFileJsonStorage>(path);
    TTaskRepository repo(storage);
    repo.Create(Titled("Buy milk"));

    auto before = ReadFile(path);
    auto mtimeBefore = fs::last_write_time(path);
    EXPECT_THROW(repo.Update(99, Titled("nope")), TNotFoundError);
    EXPECT_EQ(ReadFile(path), before);
    EXPECT_EQ(fs::last_write_time(path), mtimeBefore);
}

TEST(FileStorage, FailedWriteKeepsPreviousFile) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    auto storage = std::make_shared<TFileJsonStorage>(path);
    TTaskRepository repo(storage);
    repo.Create(Titled("Buy milk"));
    auto before = ReadFile(path);

    // A directory in the temp file's place makes opening it for writing fail.
    auto tmp = fs::path(path.string() + ".tmp");
    fs::create_directory(tmp);

    EXPECT_THROW(repo.Create(Titled("Walk dog")), TStoreWriteError);
    EXPECT_THROW(repo.Update(1, Titled("Buy oat milk")), TStoreWriteError);
    EXPECT_THROW(repo.Delete(1), TStoreWriteError);

    EXPECT_EQ(ReadFile(path), before);
    EXPECT_TRUE(fs::is_directory(tmp));

    auto all = repo.List();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].Title, "Buy milk");

    fs::remove(tmp);
    EXPECT_EQ(repo.Create(Titled("Walk dog")).Id, 2u);
}

TEST(FileStorage, UncreatableDirectoryIsWriteError) {
    TempDir dir;
    auto blocker = dir.Path / "blocker";
    WriteFile(blocker, "a regular file");
    TFileJsonStorage storage(blocker / "tasks.json");

    TTask t;
    t.Id = 1;
    t.Title = "x";
    EXPECT_THROW(storage.SaveTasks({t}), TStoreWriteError);
}

TEST(FileStorage, ScenarioSurvivesReopen) {
    TempDir dir;
    auto path = dir.Path / "data" / "tasks.json";
    {
        TTaskRepository repo(std::make_shared<TFileJsonStorage>(path));
        repo.Create(Titled("Buy milk"));
        repo.Create(Titled("Walk dog"));
        EXPECT_TRUE(repo.Delete(1));
    }

    TTaskRepository reopened(std::make_shared<TFileJsonStorage>(path));
    auto all = reopened.List();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].Id, 2u);
    EXPECT_EQ(all[0].Title, "Walk dog");
    EXPECT_EQ(reopened.Create(Titled("Feed cat")).Id, 3u);
}

TEST(Multithreading, ReadersNeverSeeTornFile) {
    TempDir dir;
    auto path = dir.Path / "tasks.json";
    auto storage = std::make_shared<TFileJsonStorage>(path);
    TTaskRepository repo(storage);

    constexpr int WRITERS = 4;
    constexpr int PER_WRITER = 15;

    std::atomic<bool> writing{true};
    std::atomic<int> corruptReads{0};
    std::atomic<int> reads{0};

    std::thread reader([&] {
        while (writing.load()) {
            try {
                auto tasks = repo.List();
                std::set<TaskId> ids;
                for (auto const& t : tasks) {
                    ids.insert(t.Id);
                }
                if (ids.size() != tasks.size()) {
                    corruptReads++;
                }
            } catch (const TCorruptStoreError&) {
                corruptReads++;
            }
            reads++;
        }
    });

    std::vector<std::thread> th;
    for (int w = 0; w < WRITERS; w++) {
        th.emplace_back([&, w] {
            for (int i = 0; i < PER_WRITER; i++) {
                repo.Create(Titled("w" + std::to_string(w) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& x : th) {
        x.join();
    }
    writing = false;
    reader.join();

    EXPECT_EQ(corruptReads.load(), 0);
    EXPECT_GT(reads.load(), 0);

    auto all = repo.List();
    ASSERT_EQ(all.size(), static_cast<size_t>(WRITERS * PER_WRITER));
    std::set<TaskId> ids;
    for (auto const& t : all) {
        ids.insert(t.Id);
    }
    EXPECT_EQ(ids.size(), all.size());
    EXPECT_EQ(*ids.begin(), 1u);
    EXPECT_EQ(*ids.rbegin(), static_cast<TaskId>(WRITERS * PER_WRITER));
}
