#pragma once

#include <string>
#include "core/date_types.hpp"
#include "core/media_file.hpp"

/**
 * @brief One technique for reading a capture date out of a file
 *
 * Implementations are read-only, finish within a bounded time and report
 * every failure as ExtractionOutcome::failed instead of throwing.
 */
class ExtractionStrategy
{
public:
    virtual ~ExtractionStrategy() = default;

    // Stable identifier used in logs, reports and configuration
    virtual std::string getName() const = 0;

    virtual ConfidenceTier getTier() const = 0;

    virtual ExtractionOutcome tryExtract(const MediaFile &file) const = 0;
};
