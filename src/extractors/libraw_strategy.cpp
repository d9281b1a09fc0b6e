#include "core/extractors/libraw_strategy.hpp"
#include "core/date_validator.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"

std::mutex LibRawStrategy::libraw_mutex_;

ExtractionOutcome LibRawStrategy::tryExtract(const MediaFile &file) const
{
    std::lock_guard<std::mutex> lock(libraw_mutex_);
    try
    {
        LibRawRAII raw;
        raw.setRaw(new LibRaw());

        int ret = raw.getRaw()->open_file(file.path.c_str());
        if (ret != LIBRAW_SUCCESS)
        {
            return ExtractionOutcome::failed(std::string("LibRaw open_file failed: ") + libraw_strerror(ret));
        }

        std::time_t timestamp = raw.getRaw()->imgdata.other.timestamp;
        if (timestamp <= 0)
        {
            return ExtractionOutcome::noDate();
        }

        auto date = DateValidator::fromTimestamp(timestamp);
        if (!date)
        {
            return ExtractionOutcome::failed("LibRaw timestamp out of range");
        }
        Logger::debug("Found RAW timestamp in " + file.path + ": " + date->toString());
        return ExtractionOutcome::found(*date, getName(), getTier());
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("LibRaw error: ") + e.what());
    }
}
