#include <gtest/gtest.h>
#include "core/extractors/ffmpeg_container_strategy.hpp"
#include "test_base.hpp"

class FfmpegContainerStrategyTest : public TempDirTest
{
protected:
    ExtractionOutcome extract(const std::filesystem::path &path)
    {
        MediaFile file(path.string(), MediaKind::MP4, 0, 0);
        return strategy_.tryExtract(file);
    }

    FfmpegContainerStrategy strategy_{5000, DatePolicy()};
};

// FFmetadata is the simplest container libavformat opens with a global tag dictionary
TEST_F(FfmpegContainerStrategyTest, CreationTimeFromFormatMetadata)
{
    auto path = writeFile("clip.ffmeta", ";FFMETADATA1\ntitle=holiday\ncreation_time=2021-05-06T07:08:09.000000Z\n");

    auto outcome = extract(path);

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2021, 5, 6, 7, 8, 9));
    EXPECT_EQ(outcome.candidate.strategy, "ffmpeg_container");
    EXPECT_EQ(outcome.candidate.tier, ConfidenceTier::CONTAINER);
}

TEST_F(FfmpegContainerStrategyTest, ContainerWithoutDateTags)
{
    auto outcome = extract(writeFile("clip.ffmeta", ";FFMETADATA1\ntitle=holiday\n"));
    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::NO_DATE);
}

TEST_F(FfmpegContainerStrategyTest, GarbageAndMissingFilesFail)
{
    std::string text;
    for (int i = 0; i < 64; ++i)
        text += "garbage payload\n";
    auto garbage = extract(writeFile("clip.mp4", text));
    EXPECT_EQ(garbage.status, ExtractionOutcome::Status::FAILED);
    EXPECT_FALSE(garbage.reason.empty());

    auto missing = extract(root_ / "absent.mp4");
    EXPECT_EQ(missing.status, ExtractionOutcome::Status::FAILED);
}
