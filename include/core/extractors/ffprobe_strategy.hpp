#pragma once

#include <string>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief Container creation_time read by an external ffprobe process
 *
 * This is the fast path for video kinds. When the executable is missing, exits
 * with an error, or exceeds its timeout (the process is killed), the outcome is
 * FAILED and the resolver moves on to the in-process container parser.
 */
class FfprobeStrategy : public ExtractionStrategy
{
public:
    /**
     * @param ffprobe_path Executable name (looked up on PATH) or path
     * @param timeout_ms Wall-clock limit per file
     */
    FfprobeStrategy(const std::string &ffprobe_path, int timeout_ms, const DatePolicy &policy);

    std::string getName() const override { return "ffprobe"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::CONTAINER; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

    bool isAvailable() const { return !executable_.empty(); }

private:
    std::string executable_;
    int timeout_ms_;
    DateValidator validator_;

    static std::string locateExecutable(const std::string &ffprobe_path);
};
