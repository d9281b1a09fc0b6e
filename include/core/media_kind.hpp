#pragma once

#include <string>
#include <vector>

/**
 * @brief Internal classification of a media file, independent of its extension
 */
enum class MediaKind
{
    JPEG,
    PNG,
    GIF,
    BMP,
    TIFF,
    WEBP,
    HEIF,
    AVIF,
    JPEG2000,
    RAW,       // Camera RAW (TIFF-based and vendor containers)
    MP4,
    QUICKTIME,
    THREE_GP,
    AVI,
    MATROSKA,
    UNSUPPORTED
};

class MediaKinds
{
public:
    /**
     * @brief Get the kind name as string
     * @param kind The media kind
     * @return Upper-case name used in logs and reports
     */
    static std::string getKindName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::JPEG:
            return "JPEG";
        case MediaKind::PNG:
            return "PNG";
        case MediaKind::GIF:
            return "GIF";
        case MediaKind::BMP:
            return "BMP";
        case MediaKind::TIFF:
            return "TIFF";
        case MediaKind::WEBP:
            return "WEBP";
        case MediaKind::HEIF:
            return "HEIF";
        case MediaKind::AVIF:
            return "AVIF";
        case MediaKind::JPEG2000:
            return "JPEG2000";
        case MediaKind::RAW:
            return "RAW";
        case MediaKind::MP4:
            return "MP4";
        case MediaKind::QUICKTIME:
            return "QUICKTIME";
        case MediaKind::THREE_GP:
            return "3GP";
        case MediaKind::AVI:
            return "AVI";
        case MediaKind::MATROSKA:
            return "MATROSKA";
        default:
            return "UNSUPPORTED";
        }
    }

    static bool isVideo(MediaKind kind)
    {
        return kind == MediaKind::MP4 || kind == MediaKind::QUICKTIME || kind == MediaKind::THREE_GP ||
               kind == MediaKind::AVI || kind == MediaKind::MATROSKA;
    }

    static bool isImage(MediaKind kind)
    {
        return kind != MediaKind::UNSUPPORTED && !isVideo(kind);
    }

    static std::vector<MediaKind> getAllKinds()
    {
        return {MediaKind::JPEG, MediaKind::PNG, MediaKind::GIF, MediaKind::BMP, MediaKind::TIFF,
                MediaKind::WEBP, MediaKind::HEIF, MediaKind::AVIF, MediaKind::JPEG2000, MediaKind::RAW,
                MediaKind::MP4, MediaKind::QUICKTIME, MediaKind::THREE_GP, MediaKind::AVI, MediaKind::MATROSKA};
    }
};
