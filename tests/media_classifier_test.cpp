#include <gtest/gtest.h>
#include "core/media_classifier.hpp"
#include "core/media_types.hpp"

TEST(MediaClassifierTest, DefaultSetsClassifyCommonExtensions)
{
    MediaClassifier classifier;

    EXPECT_EQ(classifier.classify("jpg"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("png"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("webp"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("mp4"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classify("mkv"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classify("mov"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classify("txt"), MediaType::UNKNOWN);
    EXPECT_EQ(classifier.classify(""), MediaType::UNKNOWN);
}

TEST(MediaClassifierTest, IgnoresCaseAndLeadingDot)
{
    MediaClassifier classifier;

    EXPECT_EQ(classifier.classify(".JPG"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("JpEg"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify(".Mp4"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classify(" .png "), MediaType::IMAGE);
}

TEST(MediaClassifierTest, ClassifiesPathsByExtension)
{
    MediaClassifier classifier;

    EXPECT_EQ(classifier.classifyPath("/photos/2020/IMG_0001.JPG"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classifyPath("/videos/clip.final.mkv"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classifyPath("/docs/readme"), MediaType::UNKNOWN);
    EXPECT_EQ(classifier.classifyPath("/photos.jpg/notes.txt"), MediaType::UNKNOWN);
}

TEST(MediaClassifierTest, CustomSetsReplaceDefaults)
{
    MediaClassifier classifier({"PNG"}, {".avi"});

    EXPECT_EQ(classifier.classify("png"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("avi"), MediaType::VIDEO);
    EXPECT_EQ(classifier.classify("jpg"), MediaType::UNKNOWN);
    EXPECT_EQ(classifier.classify("mp4"), MediaType::UNKNOWN);

    EXPECT_EQ(classifier.imageExtensions(), std::vector<std::string>{"png"});
    EXPECT_EQ(classifier.videoExtensions(), std::vector<std::string>{"avi"});
}

TEST(MediaClassifierTest, ImageWinsWhenExtensionIsInBothSets)
{
    MediaClassifier classifier({"ts"}, {"ts", "mp4"});
    EXPECT_EQ(classifier.classify("ts"), MediaType::IMAGE);
    EXPECT_EQ(classifier.classify("mp4"), MediaType::VIDEO);
}

TEST(MediaClassifierTest, NormalizeExtension)
{
    EXPECT_EQ(MediaClassifier::normalizeExtension(".JPG"), "jpg");
    EXPECT_EQ(MediaClassifier::normalizeExtension("  Mp4"), "mp4");
    EXPECT_EQ(MediaClassifier::normalizeExtension("."), "");
}

TEST(MediaTypesTest, NamesRoundTrip)
{
    EXPECT_EQ(MediaTypes::getTypeName(MediaType::IMAGE), "image");
    EXPECT_EQ(MediaTypes::getTypeName(MediaType::VIDEO), "video");
    EXPECT_EQ(MediaTypes::getTypeName(MediaType::UNKNOWN), "unknown");

    EXPECT_EQ(MediaTypes::fromString("IMAGE"), MediaType::IMAGE);
    EXPECT_EQ(MediaTypes::fromString("Video"), MediaType::VIDEO);
    EXPECT_EQ(MediaTypes::fromString("audio"), MediaType::UNKNOWN);
}
