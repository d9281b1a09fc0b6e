#include "core/extractors/xmp_strategy.hpp"
#include "core/extractors/exiv2_support.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <exiv2/exiv2.hpp>

namespace
{
    // Exiv2 key and the matching raw packet property, highest priority first
    const std::vector<std::pair<std::string, std::string>> XMP_DATE_TAGS = {
        {"Xmp.exif.DateTimeOriginal", "exif:DateTimeOriginal"},
        {"Xmp.photoshop.DateCreated", "photoshop:DateCreated"},
        {"Xmp.xmp.CreateDate", "xmp:CreateDate"},
        {"Xmp.xmp.ModifyDate", "xmp:ModifyDate"}};

    std::string escapeTag(const std::string &tag)
    {
        std::string escaped;
        for (char c : tag)
        {
            if (c == ':' || std::isalnum(static_cast<unsigned char>(c)))
                escaped += c;
            else
                escaped += std::string("\\") + c;
        }
        return escaped;
    }
}

XmpStrategy::XmpStrategy(size_t scan_bytes, const DatePolicy &policy)
    : scan_bytes_(scan_bytes), validator_(policy)
{
    Exiv2Support::initialize();

    // <tag>value</tag>, tag="value", tag='value'; every repetition is bounded
    for (const auto &tag : XMP_DATE_TAGS)
    {
        std::string pattern = escapeTag(tag.second) +
                              R"([>\s"'=]{1,8}(\d{4}[-:]\d{2}[-:]\d{2}(?:[T ]\d{2}:\d{2}(?::\d{2})?)?[^\s<"']{0,16}))";
        tag_patterns_.emplace_back(tag.second, std::regex(pattern));
    }
}

std::string XmpStrategy::findPacket(const std::string &buffer)
{
    size_t start = buffer.find("<x:xmpmeta");
    std::string end_marker = "</x:xmpmeta>";
    if (start == std::string::npos)
    {
        start = buffer.find("<rdf:RDF");
        end_marker = "</rdf:RDF>";
    }
    if (start == std::string::npos)
    {
        return "";
    }

    size_t end = buffer.find(end_marker, start);
    if (end == std::string::npos)
    {
        // Truncated by the scan window, use what we have
        return buffer.substr(start);
    }
    return buffer.substr(start, end + end_marker.size() - start);
}

std::optional<CaptureDate> XmpStrategy::findDate(const std::string &packet) const
{
    for (const auto &entry : tag_patterns_)
    {
        auto begin = std::sregex_iterator(packet.begin(), packet.end(), entry.second);
        for (auto it = begin; it != std::sregex_iterator(); ++it)
        {
            auto date = validator_.parseAndValidate((*it)[1].str());
            if (date)
            {
                return date;
            }
        }
    }
    return std::nullopt;
}

ExtractionOutcome XmpStrategy::tryExtract(const MediaFile &file) const
{
    if (Exiv2Support::canRead(file.kind))
    {
        return readWithExiv2(file);
    }
    return scanPacket(file);
}

ExtractionOutcome XmpStrategy::readWithExiv2(const MediaFile &file) const
{
    try
    {
        auto image = Exiv2::ImageFactory::open(file.path);
        if (!image.get())
        {
            return ExtractionOutcome::failed("Exiv2 could not open file");
        }
        image->readMetadata();

        const Exiv2::XmpData &xmp = image->xmpData();
        if (xmp.empty())
        {
            return ExtractionOutcome::noDate();
        }

        for (const auto &tag : XMP_DATE_TAGS)
        {
            auto it = xmp.findKey(Exiv2::XmpKey(tag.first));
            if (it == xmp.end())
                continue;

            auto date = validator_.parseAndValidate(it->toString());
            if (date)
            {
                Logger::debug("Found XMP date [" + tag.first + "] in " + file.path + ": " + date->toString());
                return ExtractionOutcome::found(*date, getName(), getTier());
            }
        }
        return ExtractionOutcome::noDate();
    }
    catch (const Exiv2::Error &e)
    {
        return ExtractionOutcome::failed(std::string("Exiv2 error: ") + e.what());
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("XMP read error: ") + e.what());
    }
}

ExtractionOutcome XmpStrategy::scanPacket(const MediaFile &file) const
{
    try
    {
        auto bytes = FileUtils::readFilePrefix(file.path, scan_bytes_);
        if (!bytes)
        {
            return ExtractionOutcome::failed("Cannot read file for XMP scan");
        }

        std::string buffer(bytes->begin(), bytes->end());
        std::string packet = findPacket(buffer);
        if (packet.empty())
        {
            return ExtractionOutcome::noDate();
        }

        auto date = findDate(packet);
        if (!date)
        {
            return ExtractionOutcome::noDate();
        }
        Logger::debug("Found XMP date in " + file.path + ": " + date->toString());
        return ExtractionOutcome::found(*date, getName(), getTier());
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("XMP scan error: ") + e.what());
    }
}
