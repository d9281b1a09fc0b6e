#include <gtest/gtest.h>
#include "core/extractors/libraw_strategy.hpp"
#include "test_base.hpp"

class LibRawStrategyTest : public TempDirTest
{
protected:
    ExtractionOutcome extract(const std::filesystem::path &path)
    {
        MediaFile file(path.string(), MediaKind::RAW, 0, 0);
        return strategy_.tryExtract(file);
    }

    LibRawStrategy strategy_;
};

TEST_F(LibRawStrategyTest, UnrecognizedDataFails)
{
    auto outcome = extract(writeFile("DSC_0001.NEF", std::string(4096, '\x11')));

    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::FAILED);
    EXPECT_NE(outcome.reason.find("LibRaw"), std::string::npos) << outcome.reason;
}

TEST_F(LibRawStrategyTest, MissingFileFails)
{
    EXPECT_EQ(extract(root_ / "DSC_0002.CR2").status, ExtractionOutcome::Status::FAILED);
}

TEST_F(LibRawStrategyTest, MetadataDescribesTheStrategy)
{
    EXPECT_EQ(strategy_.getName(), "libraw");
    EXPECT_EQ(strategy_.getTier(), ConfidenceTier::EMBEDDED_CAPTURE);
}
