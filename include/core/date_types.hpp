#pragma once

#include <string>
#include <optional>
#include <cstdio>

/**
 * @brief Calendar timestamp as read from metadata; time fields may be unknown
 */
struct CaptureDate
{
    int year = 0;
    int month = 0;
    int day = 0;
    std::optional<int> hour;
    std::optional<int> minute;
    std::optional<int> second;

    bool operator==(const CaptureDate &other) const
    {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second;
    }

    bool operator!=(const CaptureDate &other) const { return !(*this == other); }

    // "YYYY:MM:DD HH:MM:SS", unknown time fields rendered as 00
    std::string toString() const
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d:%02d:%02d %02d:%02d:%02d", year, month, day,
                      hour.value_or(0), minute.value_or(0), second.value_or(0));
        return buf;
    }
};

/**
 * @brief Ordinal trust level of a date source, highest first
 */
enum class ConfidenceTier
{
    EMBEDDED_CAPTURE = 4, // EXIF-style capture tags
    CONTAINER = 3,        // Container/stream metadata
    DESCRIPTIVE = 2,      // XMP-style blocks
    FILENAME = 1,         // Date patterns embedded in the file name
    FILESYSTEM = 0        // Filesystem modification time
};

inline std::string tierName(ConfidenceTier tier)
{
    switch (tier)
    {
    case ConfidenceTier::EMBEDDED_CAPTURE:
        return "embedded";
    case ConfidenceTier::CONTAINER:
        return "container";
    case ConfidenceTier::DESCRIPTIVE:
        return "descriptive";
    case ConfidenceTier::FILENAME:
        return "filename";
    case ConfidenceTier::FILESYSTEM:
        return "filesystem";
    default:
        return "unknown";
    }
}

/**
 * @brief Date produced by one extraction strategy
 */
struct DateCandidate
{
    CaptureDate date;
    std::string strategy;
    ConfidenceTier tier = ConfidenceTier::FILESYSTEM;
};

/**
 * @brief Outcome of one strategy attempt
 *
 * FAILED carries a reason; the resolver treats NO_DATE and FAILED alike and
 * advances to the next strategy.
 */
struct ExtractionOutcome
{
    enum class Status
    {
        FOUND,
        NO_DATE,
        FAILED
    };

    Status status = Status::NO_DATE;
    DateCandidate candidate;
    std::string reason;

    static ExtractionOutcome found(const CaptureDate &date, const std::string &strategy, ConfidenceTier tier)
    {
        ExtractionOutcome outcome;
        outcome.status = Status::FOUND;
        outcome.candidate.date = date;
        outcome.candidate.strategy = strategy;
        outcome.candidate.tier = tier;
        return outcome;
    }

    static ExtractionOutcome noDate()
    {
        return ExtractionOutcome();
    }

    static ExtractionOutcome failed(const std::string &reason)
    {
        ExtractionOutcome outcome;
        outcome.status = Status::FAILED;
        outcome.reason = reason;
        return outcome;
    }
};

/**
 * @brief Date resolver output: a validated date with provenance, or unresolved
 */
struct ResolvedDate
{
    bool resolved = false;
    CaptureDate date;
    std::string strategy;
    ConfidenceTier tier = ConfidenceTier::FILESYSTEM;

    static ResolvedDate unresolved()
    {
        return ResolvedDate();
    }

    static ResolvedDate fromCandidate(const DateCandidate &candidate)
    {
        ResolvedDate result;
        result.resolved = true;
        result.date = candidate.date;
        result.strategy = candidate.strategy;
        result.tier = candidate.tier;
        return result;
    }

    bool isLowConfidence() const { return resolved && tier == ConfidenceTier::FILESYSTEM; }
};
