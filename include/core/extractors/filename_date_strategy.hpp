#pragma once

#include <regex>
#include <string>
#include <vector>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief Date embedded in the file name (IMG_20230314_101500.jpg, 2023-03-14 10.15.00.png)
 *
 * Patterns are tried in configuration order and, within a pattern, left to
 * right; the first match that passes the date policy wins. Capture groups
 * 1-3 are year, month, day; groups 4-6, when present, are hour, minute, second.
 */
class FilenameDateStrategy : public ExtractionStrategy
{
public:
    FilenameDateStrategy(const std::vector<std::string> &patterns, const DatePolicy &policy);

    std::string getName() const override { return "filename"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::FILENAME; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

    std::optional<CaptureDate> matchName(const std::string &file_name) const;

    size_t getPatternCount() const { return patterns_.size(); }

private:
    std::vector<std::regex> patterns_;
    DateValidator validator_;
};
