#include "core/extractors/png_text_strategy.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cstring>
#include <ctime>
#include <fstream>

namespace
{
    const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    uint32_t readBigEndian32(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }
}

const std::vector<std::string> PngTextStrategy::date_keywords_ = {
    "creation time",
    "creation_time",
    "date:create",
    "date:modify"};

PngTextStrategy::PngTextStrategy(const DatePolicy &policy) : validator_(policy)
{
}

std::optional<std::map<std::string, std::string>> PngTextStrategy::readTextChunks(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        return std::nullopt;
    }

    uint8_t signature[8];
    if (!file.read(reinterpret_cast<char *>(signature), sizeof(signature)) ||
        std::memcmp(signature, PNG_SIGNATURE, sizeof(signature)) != 0)
    {
        return std::nullopt;
    }

    std::map<std::string, std::string> texts;
    for (int i = 0; i < MAX_CHUNKS; ++i)
    {
        uint8_t header[8];
        if (!file.read(reinterpret_cast<char *>(header), sizeof(header)))
            break;

        uint32_t length = readBigEndian32(header);
        std::string type(reinterpret_cast<const char *>(header + 4), 4);

        if (type == "IEND")
            break;

        bool is_text = (type == "tEXt" || type == "iTXt");
        if (!is_text || length > MAX_TEXT_CHUNK)
        {
            // Skip data and CRC
            file.seekg(static_cast<std::streamoff>(length) + 4, std::ios::cur);
            if (!file)
                break;
            continue;
        }

        std::string data(length, '\0');
        if (length > 0 && !file.read(&data[0], length))
            break;
        file.seekg(4, std::ios::cur);

        size_t key_end = data.find('\0');
        if (key_end == std::string::npos)
            continue;
        std::string keyword = FileUtils::toLower(data.substr(0, key_end));

        if (type == "tEXt")
        {
            texts.emplace(keyword, data.substr(key_end + 1));
            continue;
        }

        // iTXt: compression flag, compression method, language\0, translated keyword\0, text
        size_t pos = key_end + 1;
        if (pos + 2 > data.size() || data[pos] != 0)
            continue;
        pos += 2;
        size_t lang_end = data.find('\0', pos);
        if (lang_end == std::string::npos)
            continue;
        size_t translated_end = data.find('\0', lang_end + 1);
        if (translated_end == std::string::npos)
            continue;
        texts.emplace(keyword, data.substr(translated_end + 1));
    }
    return texts;
}

std::optional<CaptureDate> PngTextStrategy::parseCreationTime(const std::string &value) const
{
    auto date = validator_.parseAndValidate(value);
    if (date)
        return date;

    // RFC 1123, the form the PNG specification recommends for "Creation Time"
    std::tm tm{};
    const char *formats[] = {"%a, %d %b %Y %H:%M:%S", "%d %b %Y %H:%M:%S"};
    for (const char *format : formats)
    {
        tm = std::tm{};
        if (strptime(value.c_str(), format, &tm) != nullptr)
        {
            CaptureDate parsed;
            parsed.year = tm.tm_year + 1900;
            parsed.month = tm.tm_mon + 1;
            parsed.day = tm.tm_mday;
            parsed.hour = tm.tm_hour;
            parsed.minute = tm.tm_min;
            parsed.second = tm.tm_sec;
            if (validator_.isAcceptable(parsed))
                return parsed;
        }
    }
    return std::nullopt;
}

ExtractionOutcome PngTextStrategy::tryExtract(const MediaFile &file) const
{
    try
    {
        auto texts = readTextChunks(file.path);
        if (!texts)
        {
            return ExtractionOutcome::failed("Not a readable PNG stream");
        }

        for (const auto &keyword : date_keywords_)
        {
            auto it = texts->find(keyword);
            if (it == texts->end())
                continue;

            auto date = parseCreationTime(it->second);
            if (date)
            {
                Logger::debug("Found PNG text date [" + keyword + "] in " + file.path + ": " + date->toString());
                return ExtractionOutcome::found(*date, getName(), getTier());
            }
        }
        return ExtractionOutcome::noDate();
    }
    catch (const std::exception &e)
    {
        return ExtractionOutcome::failed(std::string("PNG chunk read error: ") + e.what());
    }
}
