#include "core/extractors/exif_strategy.hpp"
#include "core/extractors/exiv2_support.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>

const std::vector<std::string> ExifStrategy::date_keys_ = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime"};

ExifStrategy::ExifStrategy(const DatePolicy &policy) : validator_(policy)
{
    Exiv2Support::initialize();
}

ExtractionOutcome ExifStrategy::tryExtract(const MediaFile &file) const
{
    try
    {
        auto image = Exiv2::ImageFactory::open(file.path);
        if (!image.get())
        {
            return ExtractionOutcome::failed("Exiv2 could not open file");
        }
        image->readMetadata();

        const Exiv2::ExifData &exif = image->exifData();
        if (exif.empty())
        {
            return ExtractionOutcome::noDate();
        }

        for (const auto &key : date_keys_)
        {
            auto it = exif.findKey(Exiv2::ExifKey(key));
            if (it == exif.end())
                continue;

            auto date = validator_.parseAndValidate(it->toString());
            if (date)
            {
                Logger::debug("Found EXIF date [" + key + "] in " + file.path + ": " + date->toString());
                return ExtractionOutcome::found(*date, getName(), getTier());
            }
        }
        return ExtractionOutcome::noDate();
    }
    catch (const Exiv2::Error &e)
    {
        return ExtractionOutcome::failed(std::string("Exiv2 error: ") + e.what());
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("EXIF read error: ") + e.what());
    }
}
