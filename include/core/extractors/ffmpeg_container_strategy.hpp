#pragma once

#include <string>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief In-process container metadata via libavformat
 *
 * Reads the format and stream dictionaries after avformat_open_input only;
 * no packets are demuxed. An interrupt callback aborts I/O past the deadline.
 */
class FfmpegContainerStrategy : public ExtractionStrategy
{
public:
    FfmpegContainerStrategy(int timeout_ms, const DatePolicy &policy);

    std::string getName() const override { return "ffmpeg_container"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::CONTAINER; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

private:
    int timeout_ms_;
    DateValidator validator_;
};
