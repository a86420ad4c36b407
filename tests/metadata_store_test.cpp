#include "test_base.hpp"
#include "core/file_utils.hpp"
#include "database/metadata_store.hpp"
#include <set>
#include <thread>
#include <vector>

class MetadataStoreTest : public TestBase
{
protected:
    static MediaRecord makeRecord(const std::string &path, MediaType type = MediaType::IMAGE)
    {
        MediaRecord record;
        record.path = path;
        record.filename = std::filesystem::path(path).filename().string();
        record.extension = std::filesystem::path(path).extension().string();
        record.type = type;
        record.file_size = 42;
        record.modified_at = 1600000000;
        return record;
    }
};

TEST_F(MetadataStoreTest, CreatesDatabaseOnFirstOpen)
{
    ASSERT_FALSE(std::filesystem::exists(getTestDbPath()));
    MetadataStore store(getTestDbPath());

    EXPECT_TRUE(store.isOpen());
    EXPECT_TRUE(std::filesystem::exists(getTestDbPath()));
    EXPECT_EQ(store.count(), 0u);
    EXPECT_TRUE(store.loadAll().empty());
}

TEST_F(MetadataStoreTest, UnopenableDatabaseFailsEveryOperation)
{
    MetadataStore store((workDir() / "missing_dir" / "db.sqlite").string());

    EXPECT_FALSE(store.isOpen());
    DBOpResult result = store.upsert(makeRecord("/photos/a.jpg"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_TRUE(store.loadAll().empty());
    EXPECT_FALSE(store.get("/photos/a.jpg").has_value());
}

TEST_F(MetadataStoreTest, LookupSeparatesMissingFromBroken)
{
    MetadataStore store(getTestDbPath());
    ASSERT_TRUE(store.upsert(makeRecord("/photos/a.jpg")).success);

    auto found = store.lookup("/photos/a.jpg");
    EXPECT_TRUE(found.first.success);
    ASSERT_TRUE(found.second.has_value());
    EXPECT_EQ(found.second->filename, "a.jpg");

    auto missing = store.lookup("/photos/b.jpg");
    EXPECT_TRUE(missing.first.success);
    EXPECT_FALSE(missing.second.has_value());

    // Drop the table behind the store's back
    sqlite3 *other = nullptr;
    ASSERT_EQ(sqlite3_open(getTestDbPath().c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "DROP TABLE media_files", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(other);

    auto broken = store.lookup("/photos/a.jpg");
    EXPECT_FALSE(broken.first.success);
    EXPECT_FALSE(broken.first.error_message.empty());
    EXPECT_FALSE(broken.second.has_value());

    MetadataStore closed((workDir() / "missing_dir" / "db.sqlite").string());
    auto unavailable = closed.lookup("/photos/a.jpg");
    EXPECT_FALSE(unavailable.first.success);
    EXPECT_FALSE(unavailable.second.has_value());
}

TEST_F(MetadataStoreTest, UpsertIsInsertIfAbsent)
{
    MetadataStore store(getTestDbPath());

    DBOpResult first = store.upsert(makeRecord("/photos/a.jpg"));
    ASSERT_TRUE(first.success) << first.error_message;
    EXPECT_EQ(first.rows_affected, 1);

    auto stored = store.get("/photos/a.jpg");
    ASSERT_TRUE(stored.has_value());

    MediaRecord changed = makeRecord("/photos/a.jpg", MediaType::VIDEO);
    changed.file_size = 9999;
    DBOpResult second = store.upsert(changed);
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_EQ(second.rows_affected, 0);

    auto after = store.get("/photos/a.jpg");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(*after, *stored);
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(MetadataStoreTest, OneRecordPerDistinctPath)
{
    MetadataStore store(getTestDbPath());
    std::vector<std::string> calls = {"/p/a.jpg", "/p/b.mp4", "/p/a.jpg", "/p/c.txt", "/p/b.mp4", "/p/a.jpg"};

    for (const auto &path : calls)
    {
        ASSERT_TRUE(store.upsert(makeRecord(path)).success);
    }

    auto records = store.loadAll();
    std::set<std::string> distinct;
    for (const auto &record : records)
    {
        distinct.insert(record.path);
    }
    EXPECT_EQ(records.size(), 3u);
    EXPECT_EQ(distinct.size(), 3u);
}

TEST_F(MetadataStoreTest, StampsDiscoveryTimeAndKeepsFields)
{
    MetadataStore store(getTestDbPath());
    MediaRecord record = makeRecord("/photos/IMG_1.jpg");
    record.extension = ".jpg";

    auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    ASSERT_TRUE(store.upsert(record).success);

    auto stored = store.get("/photos/IMG_1.jpg");
    ASSERT_TRUE(stored.has_value());
    EXPECT_GE(stored->discovered_at_ms, before);
    EXPECT_EQ(stored->filename, "IMG_1.jpg");
    EXPECT_EQ(stored->extension, ".jpg");
    EXPECT_EQ(stored->type, MediaType::IMAGE);
    EXPECT_EQ(stored->file_size, 42u);
    EXPECT_EQ(stored->modified_at, 1600000000);
}

TEST_F(MetadataStoreTest, LoadAllInDiscoveryOrder)
{
    MetadataStore store(getTestDbPath());
    std::vector<std::string> order = {"/p/z.jpg", "/p/a.jpg", "/p/m.mp4"};
    for (const auto &path : order)
    {
        ASSERT_TRUE(store.upsert(makeRecord(path)).success);
    }

    auto records = store.loadAll();
    ASSERT_EQ(records.size(), 3u);
    for (size_t i = 0; i < order.size(); ++i)
    {
        EXPECT_EQ(records[i].path, order[i]);
    }
}

TEST_F(MetadataStoreTest, RecordsSurviveReopen)
{
    {
        MetadataStore store(getTestDbPath());
        ASSERT_TRUE(store.upsert(makeRecord("/p/a.jpg")).success);
        ASSERT_TRUE(store.upsert(makeRecord("/p/b.mp4", MediaType::VIDEO)).success);
    }

    MetadataStore reopened(getTestDbPath());
    EXPECT_EQ(reopened.count(), 2u);
    EXPECT_TRUE(reopened.exists("/p/a.jpg"));
    auto video = reopened.get("/p/b.mp4");
    ASSERT_TRUE(video.has_value());
    EXPECT_EQ(video->type, MediaType::VIDEO);
    EXPECT_EQ(reopened.upsert(makeRecord("/p/a.jpg")).rows_affected, 0);
}

TEST_F(MetadataStoreTest, CountByType)
{
    MetadataStore store(getTestDbPath());
    store.upsert(makeRecord("/p/a.jpg", MediaType::IMAGE));
    store.upsert(makeRecord("/p/b.png", MediaType::IMAGE));
    store.upsert(makeRecord("/p/c.mp4", MediaType::VIDEO));
    store.upsert(makeRecord("/p/d.txt", MediaType::UNKNOWN));

    auto counts = store.countByType();
    EXPECT_EQ(counts[MediaType::IMAGE], 2u);
    EXPECT_EQ(counts[MediaType::VIDEO], 1u);
    EXPECT_EQ(counts[MediaType::UNKNOWN], 1u);
}

TEST_F(MetadataStoreTest, FolderQueriesRespectSeparators)
{
    MetadataStore store(getTestDbPath());
    store.upsert(makeRecord("/media/a/1.jpg"));
    store.upsert(makeRecord("/media/a/sub/2.jpg"));
    store.upsert(makeRecord("/media/ab/3.jpg"));
    store.upsert(makeRecord("/media/a.jpg"));

    auto under_a = store.getByFolder("/media/a");
    ASSERT_EQ(under_a.size(), 2u);
    EXPECT_EQ(under_a[0].path, "/media/a/1.jpg");
    EXPECT_EQ(under_a[1].path, "/media/a/sub/2.jpg");

    EXPECT_EQ(store.getByFolder("/media/a/").size(), 2u);
    EXPECT_EQ(store.getByFolder("/media").size(), 4u);
    EXPECT_EQ(store.getByFolder("/").size(), 4u);
    EXPECT_TRUE(store.getByFolder("/other").empty());

    std::vector<std::string> expected = {"/media", "/media/a", "/media/a/sub", "/media/ab"};
    EXPECT_EQ(store.folders(), expected);
}

TEST_F(MetadataStoreTest, RemoveInFolder)
{
    MetadataStore store(getTestDbPath());
    store.upsert(makeRecord("/media/a/1.jpg"));
    store.upsert(makeRecord("/media/a/sub/2.jpg"));
    store.upsert(makeRecord("/media/ab/3.jpg"));

    DBOpResult result = store.removeInFolder("/media/a");
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.rows_affected, 2);
    EXPECT_EQ(store.count(), 1u);
    EXPECT_TRUE(store.exists("/media/ab/3.jpg"));

    // Removed paths can be indexed again
    EXPECT_EQ(store.upsert(makeRecord("/media/a/1.jpg")).rows_affected, 1);
}

TEST_F(MetadataStoreTest, ConcurrentUpsertsOfTheSamePathsInsertOnce)
{
    MetadataStore store(getTestDbPath());
    constexpr int kThreads = 8;
    constexpr int kPaths = 50;
    std::atomic<int> inserted{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&]
                             {
            for (int i = 0; i < kPaths; ++i)
            {
                DBOpResult result = store.upsert(makeRecord("/p/file_" + std::to_string(i) + ".jpg"));
                if (!result.success)
                    ++failures;
                inserted += result.rows_affected;
            } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(inserted.load(), kPaths);
    EXPECT_EQ(store.count(), static_cast<size_t>(kPaths));
}

TEST_F(MetadataStoreTest, OptimizeKeepsRecords)
{
    MetadataStore store(getTestDbPath());
    for (int i = 0; i < 20; ++i)
    {
        store.upsert(makeRecord("/p/" + std::to_string(i) + ".jpg"));
    }
    store.removeInFolder("/p");
    store.upsert(makeRecord("/q/keep.jpg"));

    DBOpResult result = store.optimize();
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(store.count(), 1u);
    EXPECT_GT(store.databaseSizeBytes(), 0u);
}

TEST_F(MetadataStoreTest, ToMediaRecordFillsDerivedFields)
{
    std::string path = createFile("Holiday.JPG", "12345");
    MediaRecord record = FileUtils::toMediaRecord(path, MediaType::IMAGE);

    EXPECT_EQ(record.path, path);
    EXPECT_EQ(record.filename, "Holiday.JPG");
    EXPECT_EQ(record.extension, ".jpg");
    EXPECT_EQ(record.file_size, 5u);
    EXPECT_GT(record.modified_at, 0);
    EXPECT_EQ(record.discovered_at_ms, 0);
}
