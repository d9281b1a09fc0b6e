#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "core/date_types.hpp"
#include "core/organizer_config.hpp"

/**
 * @brief The single "is this date good enough" rule used for every candidate
 *
 * A candidate is acceptable when it is a concrete calendar date (valid month
 * and day, valid time fields when present), its year is not before
 * earliest_year and it is not later than now + future_grace_days.
 */
class DateValidator
{
public:
    explicit DateValidator(const DatePolicy &policy = DatePolicy());

    bool isAcceptable(const CaptureDate &date) const;

    // Calendar and clock sanity only, no range check
    static bool isConcrete(const CaptureDate &date);

    /**
     * @brief Parse a metadata date string in any of the common EXIF/ISO forms
     * @return Parsed date, or nullopt for unparseable and known placeholder values
     */
    static std::optional<CaptureDate> parse(const std::string &date_string);

    /**
     * @brief Parse then validate
     */
    std::optional<CaptureDate> parseAndValidate(const std::string &date_string) const;

    /**
     * @brief Convert a POSIX timestamp to local calendar time
     */
    static std::optional<CaptureDate> fromTimestamp(std::time_t timestamp);

    const DatePolicy &getPolicy() const { return policy_; }

    // Longest accepted date string; anything longer is rejected before matching
    static constexpr size_t MAX_DATE_STRING_LENGTH = 64;

private:
    DatePolicy policy_;

    static const std::vector<std::string> garbage_prefixes_;
};
