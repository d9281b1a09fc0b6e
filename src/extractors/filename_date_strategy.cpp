#include "core/extractors/filename_date_strategy.hpp"
#include "logging/logger.hpp"
#include <filesystem>

FilenameDateStrategy::FilenameDateStrategy(const std::vector<std::string> &patterns, const DatePolicy &policy)
    : validator_(policy)
{
    for (const auto &pattern : patterns)
    {
        try
        {
            std::regex compiled(pattern);
            if (compiled.mark_count() < 3)
            {
                Logger::warn("Filename pattern needs at least 3 capture groups, ignoring: " + pattern);
                continue;
            }
            patterns_.push_back(std::move(compiled));
        }
        catch (const std::regex_error &e)
        {
            Logger::error("Invalid filename pattern '" + pattern + "': " + e.what());
        }
    }
}

std::optional<CaptureDate> FilenameDateStrategy::matchName(const std::string &file_name) const
{
    for (const auto &pattern : patterns_)
    {
        auto begin = std::sregex_iterator(file_name.begin(), file_name.end(), pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it)
        {
            const std::smatch &match = *it;
            CaptureDate date;
            date.year = std::stoi(match[1].str());
            date.month = std::stoi(match[2].str());
            date.day = std::stoi(match[3].str());
            if (match.size() > 6 && match[4].matched && match[5].matched && match[6].matched)
            {
                date.hour = std::stoi(match[4].str());
                date.minute = std::stoi(match[5].str());
                date.second = std::stoi(match[6].str());
            }

            if (validator_.isAcceptable(date))
            {
                return date;
            }
        }
    }
    return std::nullopt;
}

ExtractionOutcome FilenameDateStrategy::tryExtract(const MediaFile &file) const
{
    try
    {
        std::string name = std::filesystem::path(file.path).filename().string();
        auto date = matchName(name);
        if (!date)
        {
            return ExtractionOutcome::noDate();
        }
        Logger::debug("Found filename date in " + name + ": " + date->toString());
        return ExtractionOutcome::found(*date, getName(), getTier());
    }
    catch (const std::exception &e)
    {
        // std::stoi on a group that matched non-digits
        return ExtractionOutcome::failed(std::string("Filename pattern error: ") + e.what());
    }
}
