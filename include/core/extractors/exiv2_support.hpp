#pragma once

#include "core/media_kind.hpp"

/**
 * @brief Process-wide Exiv2 setup shared by the EXIF and XMP readers
 */
class Exiv2Support
{
public:
    // Mutes Exiv2 logging, enables BMFF where built in and initializes the XMP toolkit; runs once
    static void initialize();

    // Kinds whose containers Exiv2 parses for metadata
    static bool canRead(MediaKind kind);
};
