#include <gtest/gtest.h>
#include <chrono>
#include "core/date_resolver.hpp"
#include "core/extractor_registry.hpp"
#include "core/extractors/ffprobe_strategy.hpp"
#include "core/extractors/filename_date_strategy.hpp"
#include "test_base.hpp"

namespace fs = std::filesystem;

/**
 * @brief Drives FfprobeStrategy against small shell scripts standing in for ffprobe
 */
class FfprobeStrategyTest : public TempDirTest
{
protected:
    std::string fakeFfprobe(const std::string &body)
    {
        auto path = writeFile("bin/ffprobe", "#!/bin/sh\n" + body + "\n");
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path.string();
    }

    MediaFile video(const std::string &name)
    {
        auto path = writeFile("incoming/" + name, "not really a movie");
        return MediaFile(path.string(), MediaKind::QUICKTIME, 18, 0);
    }
};

TEST_F(FfprobeStrategyTest, CreationTimeFromOutput)
{
    FfprobeStrategy strategy(fakeFfprobe("echo 2021-05-06T07:08:09.000000Z"), 5000, DatePolicy());
    ASSERT_TRUE(strategy.isAvailable());

    auto outcome = strategy.tryExtract(video("clip.mov"));

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2021, 5, 6, 7, 8, 9));
    EXPECT_EQ(outcome.candidate.strategy, "ffprobe");
    EXPECT_EQ(outcome.candidate.tier, ConfidenceTier::CONTAINER);
}

TEST_F(FfprobeStrategyTest, NonZeroExitFailsEvenWithOutput)
{
    FfprobeStrategy strategy(fakeFfprobe("echo 2021-05-06T07:08:09.000000Z\nexit 1"), 5000, DatePolicy());

    auto outcome = strategy.tryExtract(video("clip.mov"));

    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::FAILED);
    EXPECT_NE(outcome.reason.find("exited with code 1"), std::string::npos) << outcome.reason;
}

TEST_F(FfprobeStrategyTest, HungFfprobeIsKilledAtTimeout)
{
    FfprobeStrategy strategy(fakeFfprobe("exec sleep 30"), 300, DatePolicy());

    auto started = std::chrono::steady_clock::now();
    auto outcome = strategy.tryExtract(video("clip.mov"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::FAILED);
    EXPECT_NE(outcome.reason.find("timed out"), std::string::npos) << outcome.reason;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 10);
}

TEST_F(FfprobeStrategyTest, MissingExecutableIsUnavailable)
{
    FfprobeStrategy strategy("/nonexistent/ffprobe", 5000, DatePolicy());

    EXPECT_FALSE(strategy.isAvailable());
    EXPECT_EQ(strategy.tryExtract(video("clip.mov")).status, ExtractionOutcome::Status::FAILED);
}

TEST_F(FfprobeStrategyTest, SilentFfprobeHasNoDate)
{
    FfprobeStrategy strategy(fakeFfprobe("exit 0"), 5000, DatePolicy());
    EXPECT_EQ(strategy.tryExtract(video("clip.mov")).status, ExtractionOutcome::Status::NO_DATE);
}

TEST_F(FfprobeStrategyTest, FailingFfprobeFallsThroughToFilename)
{
    DatePolicy policy;
    ExtractorRegistry registry;
    registry.registerStrategy(MediaKind::QUICKTIME, std::make_shared<FfprobeStrategy>(fakeFfprobe("exit 1"), 5000, policy));
    registry.registerStrategy(MediaKind::QUICKTIME,
                              std::make_shared<FilenameDateStrategy>(ExtractionConfig().filename_patterns, policy));
    DateResolver resolver(registry, policy);

    ResolvedDate resolved = resolver.resolve(video("VID_20220101_120000.mov"));

    ASSERT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.strategy, "filename");
    EXPECT_EQ(resolved.date.year, 2022);
    EXPECT_EQ(resolved.date.month, 1);
    EXPECT_EQ(resolved.date.day, 1);
}
