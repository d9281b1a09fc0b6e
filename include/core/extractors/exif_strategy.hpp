#pragma once

#include <string>
#include <vector>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief Embedded EXIF capture time read through Exiv2
 *
 * Tags are consulted in order DateTimeOriginal, DateTimeDigitized,
 * Image.DateTime; the first acceptable one wins.
 */
class ExifStrategy : public ExtractionStrategy
{
public:
    explicit ExifStrategy(const DatePolicy &policy);

    std::string getName() const override { return "exif"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::EMBEDDED_CAPTURE; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

private:
    DateValidator validator_;
    static const std::vector<std::string> date_keys_;
};
