#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utime.h>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base fixture giving each test its own scratch directory
 */
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                ("media_organizer_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                 std::to_string(::getpid()));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path writeFile(const std::string &relative_path, const std::string &content)
    {
        std::filesystem::path path = root_ / relative_path;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static void setModificationTime(const std::filesystem::path &path, std::time_t timestamp)
    {
        struct utimbuf times;
        times.actime = timestamp;
        times.modtime = timestamp;
        ASSERT_EQ(::utime(path.c_str(), &times), 0);
    }

    // Local-time timestamp for a calendar date
    static std::time_t localTimestamp(int year, int month, int day, int hour = 12)
    {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_isdst = -1;
        return std::mktime(&tm);
    }

    std::filesystem::path root_;
};

/**
 * @brief Strategy returning a fixed outcome and counting calls
 */
class FixedOutcomeStrategy : public ExtractionStrategy
{
public:
    FixedOutcomeStrategy(const std::string &name, ConfidenceTier tier, ExtractionOutcome outcome)
        : name_(name), tier_(tier), outcome_(outcome) {}

    std::string getName() const override { return name_; }
    ConfidenceTier getTier() const override { return tier_; }
    ExtractionOutcome tryExtract(const MediaFile &) const override
    {
        calls_.fetch_add(1);
        return outcome_;
    }

    int getCallCount() const { return calls_.load(); }

private:
    std::string name_;
    ConfidenceTier tier_;
    ExtractionOutcome outcome_;
    mutable std::atomic<int> calls_{0};
};

class ThrowingStrategy : public ExtractionStrategy
{
public:
    std::string getName() const override { return "throwing"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::EMBEDDED_CAPTURE; }
    ExtractionOutcome tryExtract(const MediaFile &) const override
    {
        throw std::runtime_error("decoder exploded");
    }
};

/**
 * @brief Stands in for an embedded capture tag: reads "DateTimeOriginal=..." from the file body
 */
class EmbeddedTagStrategy : public ExtractionStrategy
{
public:
    std::string getName() const override { return "exif"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::EMBEDDED_CAPTURE; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override
    {
        auto bytes = FileUtils::readFilePrefix(file.path, 4096);
        if (!bytes)
            return ExtractionOutcome::failed("unreadable");

        std::string text(bytes->begin(), bytes->end());
        const std::string marker = "DateTimeOriginal=";
        size_t pos = text.find(marker);
        if (pos == std::string::npos)
            return ExtractionOutcome::noDate();

        auto date = DateValidator::parse(text.substr(pos + marker.size(), 19));
        if (!date)
            return ExtractionOutcome::failed("bad tag");
        return ExtractionOutcome::found(*date, getName(), getTier());
    }
};

inline CaptureDate makeDate(int year, int month, int day)
{
    CaptureDate date;
    date.year = year;
    date.month = month;
    date.day = day;
    return date;
}

inline CaptureDate makeDateTime(int year, int month, int day, int hour, int minute, int second)
{
    CaptureDate date = makeDate(year, month, day);
    date.hour = hour;
    date.minute = minute;
    date.second = second;
    return date;
}
