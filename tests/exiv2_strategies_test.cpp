#include <gtest/gtest.h>
#include <exiv2/exiv2.hpp>
#include <map>
#include "core/date_resolver.hpp"
#include "core/extractor_registry.hpp"
#include "core/extractors/exif_strategy.hpp"
#include "core/extractors/xmp_strategy.hpp"
#include "test_base.hpp"

namespace fs = std::filesystem;

/**
 * @brief Writes real metadata into blank JPEGs through Exiv2 and reads it back via the strategies
 */
class Exiv2StrategiesTest : public TempDirTest
{
protected:
    fs::path blankJpeg(const std::string &name)
    {
        fs::path path = root_ / name;
        auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, path.string());
        EXPECT_TRUE(image.get() != nullptr);
        return path;
    }

    fs::path jpegWithExif(const std::string &name, const std::map<std::string, std::string> &tags)
    {
        fs::path path = blankJpeg(name);
        auto image = Exiv2::ImageFactory::open(path.string());
        image->readMetadata();
        Exiv2::ExifData exif;
        for (const auto &[key, value] : tags)
        {
            exif[key] = value;
        }
        image->setExifData(exif);
        image->writeMetadata();
        return path;
    }

    fs::path jpegWithXmp(const std::string &name, const std::map<std::string, std::string> &tags)
    {
        fs::path path = blankJpeg(name);
        auto image = Exiv2::ImageFactory::open(path.string());
        image->readMetadata();
        Exiv2::XmpData xmp;
        for (const auto &[key, value] : tags)
        {
            xmp[key] = value;
        }
        image->setXmpData(xmp);
        image->writeMetadata();
        return path;
    }

    static MediaFile jpeg(const fs::path &path)
    {
        return MediaFile(path.string(), MediaKind::JPEG, fs::file_size(path), 0);
    }

    ExifStrategy exif_{DatePolicy()};
};

TEST_F(Exiv2StrategiesTest, DateTimeOriginalIsFound)
{
    auto path = jpegWithExif("IMG_0005.JPG", {{"Exif.Photo.DateTimeOriginal", "2023:03:14 09:41:00"}});

    auto outcome = exif_.tryExtract(jpeg(path));

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2023, 3, 14, 9, 41, 0));
    EXPECT_EQ(outcome.candidate.strategy, "exif");
    EXPECT_EQ(outcome.candidate.tier, ConfidenceTier::EMBEDDED_CAPTURE);
}

TEST_F(Exiv2StrategiesTest, PlaceholderOriginalFallsBackToDigitized)
{
    auto path = jpegWithExif("IMG_0006.JPG", {{"Exif.Photo.DateTimeOriginal", "0000:00:00 00:00:00"},
                                              {"Exif.Photo.DateTimeDigitized", "2021:07:04 18:00:00"}});

    auto outcome = exif_.tryExtract(jpeg(path));

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2021, 7, 4, 18, 0, 0));
}

TEST_F(Exiv2StrategiesTest, BlankJpegHasNoDate)
{
    auto outcome = exif_.tryExtract(jpeg(blankJpeg("blank.jpg")));
    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::NO_DATE);
}

TEST_F(Exiv2StrategiesTest, UnparseableFileFails)
{
    auto path = writeFile("notes.jpg", "this is not an image at all");
    auto outcome = exif_.tryExtract(MediaFile(path.string(), MediaKind::JPEG, 27, 0));

    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::FAILED);
    EXPECT_FALSE(outcome.reason.empty());
}

TEST_F(Exiv2StrategiesTest, DefaultChainResolvesFromExif)
{
    auto path = jpegWithExif("IMG_0005.JPG", {{"Exif.Photo.DateTimeOriginal", "2023:03:14 09:41:00"}});
    DatePolicy policy;
    auto registry = ExtractorRegistry::createDefault(ExtractionConfig(), policy);
    DateResolver resolver(registry, policy);

    ResolvedDate resolved = resolver.resolve(jpeg(path));

    ASSERT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.strategy, "exif");
    EXPECT_EQ(resolved.date, makeDateTime(2023, 3, 14, 9, 41, 0));
}

TEST_F(Exiv2StrategiesTest, XmpPacketIsReadThroughExiv2)
{
#ifndef EXV_HAVE_XMP_TOOLKIT
    GTEST_SKIP() << "Exiv2 built without XMP support";
#endif
    auto path = jpegWithXmp("edited.jpg", {{"Xmp.xmp.CreateDate", "2019-06-01T08:00:00"}});
    XmpStrategy xmp(3 * 1024 * 1024, DatePolicy());

    auto outcome = xmp.tryExtract(jpeg(path));

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2019, 6, 1, 8, 0, 0));
    EXPECT_EQ(outcome.candidate.strategy, "xmp");
    EXPECT_EQ(outcome.candidate.tier, ConfidenceTier::DESCRIPTIVE);
}

TEST_F(Exiv2StrategiesTest, XmpCaptureTagOutranksModifyDate)
{
#ifndef EXV_HAVE_XMP_TOOLKIT
    GTEST_SKIP() << "Exiv2 built without XMP support";
#endif
    auto path = jpegWithXmp("edited.jpg", {{"Xmp.xmp.ModifyDate", "2024-01-01T00:00:00"},
                                           {"Xmp.exif.DateTimeOriginal", "2016-02-29T12:00:00"}});
    XmpStrategy xmp(3 * 1024 * 1024, DatePolicy());

    auto outcome = xmp.tryExtract(jpeg(path));

    ASSERT_EQ(outcome.status, ExtractionOutcome::Status::FOUND) << outcome.reason;
    EXPECT_EQ(outcome.candidate.date, makeDateTime(2016, 2, 29, 12, 0, 0));
}

TEST_F(Exiv2StrategiesTest, JpegWithoutXmpHasNoXmpDate)
{
    XmpStrategy xmp(3 * 1024 * 1024, DatePolicy());
    auto outcome = xmp.tryExtract(jpeg(blankJpeg("plain.jpg")));
    EXPECT_EQ(outcome.status, ExtractionOutcome::Status::NO_DATE);
}
