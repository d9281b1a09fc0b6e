#include "core/file_classifier.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cstring>

const std::map<std::string, MediaKind> FileClassifier::extension_kinds_ = {
    {"jpg", MediaKind::JPEG},
    {"jpeg", MediaKind::JPEG},
    {"jpe", MediaKind::JPEG},
    {"mpo", MediaKind::JPEG},
    {"png", MediaKind::PNG},
    {"gif", MediaKind::GIF},
    {"bmp", MediaKind::BMP},
    {"tif", MediaKind::TIFF},
    {"tiff", MediaKind::TIFF},
    {"webp", MediaKind::WEBP},
    {"heic", MediaKind::HEIF},
    {"heif", MediaKind::HEIF},
    {"avif", MediaKind::AVIF},
    {"jp2", MediaKind::JPEG2000},
    {"j2k", MediaKind::JPEG2000},
    {"dng", MediaKind::RAW},
    {"cr2", MediaKind::RAW},
    {"cr3", MediaKind::RAW},
    {"nef", MediaKind::RAW},
    {"arw", MediaKind::RAW},
    {"orf", MediaKind::RAW},
    {"rw2", MediaKind::RAW},
    {"raf", MediaKind::RAW},
    {"pef", MediaKind::RAW},
    {"srw", MediaKind::RAW},
    {"mp4", MediaKind::MP4},
    {"m4v", MediaKind::MP4},
    {"mov", MediaKind::QUICKTIME},
    {"qt", MediaKind::QUICKTIME},
    {"3gp", MediaKind::THREE_GP},
    {"3g2", MediaKind::THREE_GP},
    {"avi", MediaKind::AVI},
    {"mkv", MediaKind::MATROSKA},
    {"webm", MediaKind::MATROSKA}};

// ISO-BMFF containers and TIFF-structured files share extensions and signatures
const std::set<std::string> FileClassifier::ambiguous_extensions_ = {
    "mp4", "m4v", "mov", "3gp", "3g2", "heic", "heif", "avif", "tif", "tiff", "dng"};

namespace
{
    bool startsWith(const std::vector<uint8_t> &data, const char *signature, size_t length, size_t offset = 0)
    {
        return data.size() >= offset + length && std::memcmp(data.data() + offset, signature, length) == 0;
    }
}

MediaKind FileClassifier::classify(const std::string &file_path, const std::vector<uint8_t> &prefix)
{
    std::string ext = FileUtils::getFileExtension(file_path);

    if (ext.empty())
    {
        auto sniffed = sniff(prefix);
        if (sniffed)
        {
            Logger::debug("Classified extensionless file by signature: " + file_path + " -> " + MediaKinds::getKindName(*sniffed));
            return *sniffed;
        }
        return MediaKind::UNSUPPORTED;
    }

    auto it = extension_kinds_.find(ext);
    if (it == extension_kinds_.end())
    {
        return MediaKind::UNSUPPORTED;
    }

    if (isAmbiguousExtension(ext))
    {
        auto sniffed = sniff(prefix);
        if (sniffed && *sniffed != it->second)
        {
            // A TIFF signature on a RAW extension is still RAW
            if (!(it->second == MediaKind::RAW && *sniffed == MediaKind::TIFF))
            {
                Logger::debug("Signature overrides extension for " + file_path + ": " +
                              MediaKinds::getKindName(it->second) + " -> " + MediaKinds::getKindName(*sniffed));
                return *sniffed;
            }
        }
    }
    return it->second;
}

std::optional<MediaKind> FileClassifier::sniff(const std::vector<uint8_t> &prefix)
{
    if (startsWith(prefix, "\xFF\xD8\xFF", 3))
        return MediaKind::JPEG;
    if (startsWith(prefix, "\x89PNG\r\n\x1A\n", 8))
        return MediaKind::PNG;
    if (startsWith(prefix, "GIF87a", 6) || startsWith(prefix, "GIF89a", 6))
        return MediaKind::GIF;
    if (startsWith(prefix, "II*\0", 4) || startsWith(prefix, "MM\0*", 4))
        return MediaKind::TIFF;
    if (startsWith(prefix, "RIFF", 4))
    {
        if (startsWith(prefix, "WEBP", 4, 8))
            return MediaKind::WEBP;
        if (startsWith(prefix, "AVI ", 4, 8))
            return MediaKind::AVI;
        return std::nullopt;
    }
    if (startsWith(prefix, "\x1A\x45\xDF\xA3", 4))
        return MediaKind::MATROSKA;
    if (startsWith(prefix, "\0\0\0\x0CjP  \r\n\x87\n", 12))
        return MediaKind::JPEG2000;
    if (startsWith(prefix, "FUJIFILMCCD-RAW", 15))
        return MediaKind::RAW;
    if (startsWith(prefix, "ftyp", 4, 4))
        return sniffIsoBmffBrand(prefix);
    if (startsWith(prefix, "BM", 2) && prefix.size() >= 14)
        return MediaKind::BMP;
    return std::nullopt;
}

std::optional<MediaKind> FileClassifier::sniffIsoBmffBrand(const std::vector<uint8_t> &prefix)
{
    if (prefix.size() < 12)
        return std::nullopt;

    std::string brand(reinterpret_cast<const char *>(prefix.data()) + 8, 4);
    if (brand == "qt  ")
        return MediaKind::QUICKTIME;
    if (brand.compare(0, 3, "3gp") == 0 || brand.compare(0, 3, "3g2") == 0)
        return MediaKind::THREE_GP;
    if (brand == "heic" || brand == "heix" || brand == "heim" || brand == "heis" ||
        brand == "hevc" || brand == "hevx" || brand == "mif1" || brand == "msf1")
        return MediaKind::HEIF;
    if (brand == "avif" || brand == "avis")
        return MediaKind::AVIF;
    if (brand == "crx ")
        return MediaKind::RAW;
    return MediaKind::MP4;
}

bool FileClassifier::isAmbiguousExtension(const std::string &extension)
{
    return ambiguous_extensions_.count(FileUtils::toLower(extension)) > 0;
}

std::vector<std::string> FileClassifier::getSupportedExtensions()
{
    std::vector<std::string> extensions;
    for (const auto &entry : extension_kinds_)
    {
        extensions.push_back(entry.first);
    }
    return extensions;
}
