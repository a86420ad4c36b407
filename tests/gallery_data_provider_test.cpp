#include "test_base.hpp"
#include "core/gallery_data_provider.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

class GalleryDataProviderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<MetadataStore>(getTestDbPath());
        thumbnails_ = std::make_unique<ThumbnailCache>(32, 1, [](const std::string &, int max_dimension)
                                                       { return cv::Mat(max_dimension, max_dimension, CV_8UC3, cv::Scalar(1, 2, 3)); });
        ASSERT_TRUE(store_->isOpen());
    }

    void TearDown() override
    {
        thumbnails_.reset();
        store_.reset();
        TestBase::TearDown();
    }

    void addRecord(const std::string &path, MediaType type)
    {
        MediaRecord record;
        record.path = path;
        record.filename = std::filesystem::path(path).filename().string();
        record.extension = std::filesystem::path(path).extension().string();
        record.type = type;
        ASSERT_TRUE(store_->upsert(record).success);
    }

    std::unique_ptr<MetadataStore> store_;
    std::unique_ptr<ThumbnailCache> thumbnails_;
};

TEST_F(GalleryDataProviderTest, EmptyUntilRefreshed)
{
    addRecord("/p/a.jpg", MediaType::IMAGE);
    GalleryDataProvider gallery(*store_, *thumbnails_);

    EXPECT_EQ(gallery.rowCount(), 0u);
    gallery.refresh();
    EXPECT_EQ(gallery.rowCount(), 1u);
    EXPECT_EQ(gallery.rowAt(0).path, "/p/a.jpg");
}

TEST_F(GalleryDataProviderTest, RowAtOutOfRangeThrows)
{
    addRecord("/p/a.jpg", MediaType::IMAGE);
    addRecord("/p/b.mp4", MediaType::VIDEO);
    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.refresh();

    EXPECT_NO_THROW(gallery.rowAt(1));
    EXPECT_THROW(gallery.rowAt(2), std::out_of_range);
    EXPECT_THROW(gallery.rowAt(static_cast<size_t>(-1)), std::out_of_range);
    EXPECT_THROW(gallery.thumbnailFor(5), std::out_of_range);
}

TEST_F(GalleryDataProviderTest, RowsFollowDiscoveryOrder)
{
    addRecord("/p/z.jpg", MediaType::IMAGE);
    addRecord("/p/a.mp4", MediaType::VIDEO);
    addRecord("/p/m.txt", MediaType::UNKNOWN);

    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.refresh();

    ASSERT_EQ(gallery.rowCount(), 3u);
    EXPECT_EQ(gallery.rowAt(0).path, "/p/z.jpg");
    EXPECT_EQ(gallery.rowAt(1).type, MediaType::VIDEO);
    EXPECT_EQ(gallery.rowAt(2).filename, "m.txt");
}

TEST_F(GalleryDataProviderTest, ThumbnailForDelegatesToCache)
{
    addRecord("/p/a.jpg", MediaType::IMAGE);
    addRecord("/p/b.mp4", MediaType::VIDEO);
    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.refresh();

    EXPECT_EQ(gallery.thumbnailFor(1).state, Thumbnail::State::VIDEO);

    Thumbnail first = gallery.thumbnailFor(0);
    EXPECT_TRUE(first.state == Thumbnail::State::PENDING || first.state == Thumbnail::State::READY);
    thumbnails_->waitIdle();

    Thumbnail ready = gallery.thumbnailFor(0);
    EXPECT_EQ(ready.state, Thumbnail::State::READY);
    EXPECT_EQ(ready.image->cols, 32);
    EXPECT_EQ(thumbnails_->decodeCount(), 1u);
}

TEST_F(GalleryDataProviderTest, FolderFilterRestrictsRows)
{
    addRecord("/media/a/1.jpg", MediaType::IMAGE);
    addRecord("/media/a/sub/2.jpg", MediaType::IMAGE);
    addRecord("/media/ab/3.jpg", MediaType::IMAGE);

    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.setFolderFilter("/media/a/");
    ASSERT_TRUE(gallery.folderFilter().has_value());
    EXPECT_EQ(*gallery.folderFilter(), "/media/a");

    gallery.refresh();
    ASSERT_EQ(gallery.rowCount(), 2u);
    EXPECT_EQ(gallery.rowAt(0).path, "/media/a/1.jpg");
    EXPECT_EQ(gallery.rowAt(1).path, "/media/a/sub/2.jpg");

    gallery.clearFolderFilter();
    gallery.refresh();
    EXPECT_EQ(gallery.rowCount(), 3u);
}

TEST_F(GalleryDataProviderTest, SnapshotIsUnaffectedByRefresh)
{
    addRecord("/p/a.jpg", MediaType::IMAGE);
    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.refresh();

    auto before = gallery.snapshot();
    addRecord("/p/b.jpg", MediaType::IMAGE);
    gallery.refresh();

    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(gallery.snapshot()->size(), 2u);
}

TEST_F(GalleryDataProviderTest, ReadsDuringRefreshNeverSeeTornRecords)
{
    for (int i = 0; i < 200; ++i)
    {
        addRecord("/p/file_" + std::to_string(i) + ".jpg", MediaType::IMAGE);
    }

    GalleryDataProvider gallery(*store_, *thumbnails_);
    gallery.refresh();

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::atomic<long> reads{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t)
    {
        readers.emplace_back([&]
                             {
            while (!stop.load())
            {
                auto rows = gallery.snapshot();
                for (size_t i = 0; i < rows->size(); i += 7)
                {
                    const MediaRecord &record = (*rows)[i];
                    if (record.path != "/p/" + record.filename || record.type != MediaType::IMAGE)
                        ++torn;
                    ++reads;
                }

                size_t count = gallery.rowCount();
                if (count > 0)
                {
                    try
                    {
                        MediaRecord record = gallery.rowAt(count - 1);
                        if (record.path.empty())
                            ++torn;
                    }
                    catch (const std::out_of_range &)
                    {
                        // Row count only grows here, so this cannot happen
                        ++torn;
                    }
                }
            } });
    }

    for (int round = 0; round < 20; ++round)
    {
        addRecord("/p/extra_" + std::to_string(round) + ".jpg", MediaType::IMAGE);
        gallery.refresh();
    }
    EXPECT_TRUE(waitUntil([&]
                          { return reads.load() > 0; }));
    stop = true;
    for (auto &reader : readers)
    {
        reader.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(gallery.rowCount(), 220u);
}
