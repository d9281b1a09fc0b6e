#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief Dates from embedded XMP
 *
 * Priority: exif:DateTimeOriginal, photoshop:DateCreated, xmp:CreateDate,
 * xmp:ModifyDate.
 *
 * Kinds Exiv2 understands are read through Exiv2's XmpData. GIF and video
 * containers are not, so for those the first scan_bytes of the file are
 * searched for an x:xmpmeta or rdf:RDF block and the date properties are
 * matched in element and attribute form with bounded patterns.
 */
class XmpStrategy : public ExtractionStrategy
{
public:
    XmpStrategy(size_t scan_bytes, const DatePolicy &policy);

    std::string getName() const override { return "xmp"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::DESCRIPTIVE; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

    /**
     * @brief Extract the XMP packet text from a byte buffer
     * @return Packet text, or empty string when no packet is present
     */
    static std::string findPacket(const std::string &buffer);

    /**
     * @brief Find the highest-priority acceptable date in a raw packet
     */
    std::optional<CaptureDate> findDate(const std::string &packet) const;

private:
    size_t scan_bytes_;
    DateValidator validator_;
    std::vector<std::pair<std::string, std::regex>> tag_patterns_;

    ExtractionOutcome readWithExiv2(const MediaFile &file) const;
    ExtractionOutcome scanPacket(const MediaFile &file) const;
};
