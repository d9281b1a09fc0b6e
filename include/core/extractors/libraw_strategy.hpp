#pragma once

#include <mutex>
#include <string>
#include "core/extraction_strategy.hpp"

/**
 * @brief Capture timestamp from a camera RAW header via LibRaw
 *
 * Only the file header is opened; no image data is unpacked.
 */
class LibRawStrategy : public ExtractionStrategy
{
public:
    std::string getName() const override { return "libraw"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::EMBEDDED_CAPTURE; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

private:
    // LibRaw (non-reentrant build) is not safe for concurrent use
    static std::mutex libraw_mutex_;
};
