#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include "core/media_kind.hpp"

/**
 * @brief Immutable record of one discovered source file
 */
struct MediaFile
{
    std::string path;           // Absolute source path
    MediaKind kind;             // Declared media kind (UNSUPPORTED if classification failed)
    uint64_t size;              // File size in bytes
    std::time_t modification_time; // Filesystem modification time

    MediaFile(const std::string &p, MediaKind k, uint64_t s, std::time_t mtime)
        : path(p), kind(k), size(s), modification_time(mtime) {}
};
