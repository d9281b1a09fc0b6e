#include "core/date_validator.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <regex>
#include <tuple>

const std::vector<std::string> DateValidator::garbage_prefixes_ = {
    "0000:00:00",
    "    :  :  ",
    "0000-00-00",
    "1970:01:01 00:00:00",
    "1970-01-01 00:00:00",
    "1970-01-01T00:00:00"};

namespace
{
    bool isLeapYear(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int daysInMonth(int year, int month)
    {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && isLeapYear(year))
            return 29;
        return days[month - 1];
    }

    // EXIF ASCII values may carry trailing NULs
    std::string trim(const std::string &value)
    {
        static const std::string whitespace(" \t\r\n\0", 5);
        const auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos)
            return "";
        const auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }

    std::tuple<int, int, int, int, int, int> sortKey(const CaptureDate &c)
    {
        return std::make_tuple(c.year, c.month, c.day, c.hour.value_or(0), c.minute.value_or(0), c.second.value_or(0));
    }
}

DateValidator::DateValidator(const DatePolicy &policy) : policy_(policy) {}

bool DateValidator::isConcrete(const CaptureDate &date)
{
    if (date.month < 1 || date.month > 12)
        return false;
    if (date.day < 1 || date.day > daysInMonth(date.year, date.month))
        return false;
    if (date.hour && (*date.hour < 0 || *date.hour > 23))
        return false;
    if (date.minute && (*date.minute < 0 || *date.minute > 59))
        return false;
    // 60 allows a leap second
    if (date.second && (*date.second < 0 || *date.second > 60))
        return false;
    return true;
}

bool DateValidator::isAcceptable(const CaptureDate &date) const
{
    if (!isConcrete(date))
    {
        Logger::debug("Rejected non-calendar date: " + date.toString());
        return false;
    }
    if (date.year < policy_.earliest_year)
    {
        Logger::debug("Rejected pre-digital date: " + date.toString());
        return false;
    }

    auto latest = std::chrono::system_clock::now() + std::chrono::hours(24 * policy_.future_grace_days);
    auto latest_date = fromTimestamp(std::chrono::system_clock::to_time_t(latest));
    if (latest_date)
    {
        if (sortKey(date) > sortKey(*latest_date))
        {
            Logger::debug("Rejected future date: " + date.toString());
            return false;
        }
    }
    return true;
}

std::optional<CaptureDate> DateValidator::parse(const std::string &date_string)
{
    std::string value = trim(date_string);
    if (value.empty())
        return std::nullopt;
    if (value.size() > MAX_DATE_STRING_LENGTH)
    {
        Logger::debug("Rejected oversized date string (" + std::to_string(value.size()) + " bytes)");
        return std::nullopt;
    }

    for (const auto &garbage : garbage_prefixes_)
    {
        if (value.compare(0, garbage.size(), garbage) == 0)
        {
            Logger::debug("Rejected placeholder date: " + value);
            return std::nullopt;
        }
    }

    // EXIF "YYYY:MM:DD HH:MM:SS", ISO "YYYY-MM-DD[T ]HH:MM[:SS][.fff][Z|+hh:mm]" and date-only forms
    static const std::regex pattern(
        R"(^(\d{4})[:\-](\d{2})[:\-](\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2}))?(?:[.,]\d{1,9})?)?\s{0,4}(?:Z|UTC|[+\-]\d{2}:?\d{2})?$)");
    std::smatch match;
    if (!std::regex_match(value, match, pattern))
    {
        Logger::debug("Could not parse date string: " + value);
        return std::nullopt;
    }

    CaptureDate date;
    date.year = std::stoi(match[1].str());
    date.month = std::stoi(match[2].str());
    date.day = std::stoi(match[3].str());
    if (match[4].matched)
    {
        date.hour = std::stoi(match[4].str());
        date.minute = std::stoi(match[5].str());
        if (match[6].matched)
            date.second = std::stoi(match[6].str());
    }
    return date;
}

std::optional<CaptureDate> DateValidator::parseAndValidate(const std::string &date_string) const
{
    auto date = parse(date_string);
    if (!date || !isAcceptable(*date))
        return std::nullopt;
    return date;
}

std::optional<CaptureDate> DateValidator::fromTimestamp(std::time_t timestamp)
{
    std::tm local{};
    if (localtime_r(&timestamp, &local) == nullptr)
        return std::nullopt;

    CaptureDate date;
    date.year = local.tm_year + 1900;
    date.month = local.tm_mon + 1;
    date.day = local.tm_mday;
    date.hour = local.tm_hour;
    date.minute = local.tm_min;
    date.second = local.tm_sec;
    return date;
}
