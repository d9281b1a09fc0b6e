#pragma once

#include <string>
#include "core/media_file.hpp"
#include "core/processing_result.hpp"

/**
 * @brief Carries out a PlacementDecision on disk
 *
 * A destination path is either absent or holds the complete file: bytes are
 * written to a hidden temporary in the destination directory and published
 * with a no-clobber link. A moved source is unlinked only after the
 * destination is in place. SKIP_DUPLICATE does nothing.
 *
 * Errors map to SOURCE_UNREADABLE, DESTINATION_WRITE_FAILED or
 * DESTINATION_CONFLICT (destination appeared behind the planner's back).
 */
class FileMover
{
public:
    ProcessingResult apply(const PlacementDecision &decision, const MediaFile &file) const;

    static constexpr const char *TEMPORARY_SUFFIX = ".partial";

private:
    struct TransferError
    {
        ErrorKind kind = ErrorKind::NONE;
        std::string message;
    };

    // Same-filesystem move without copying bytes
    static bool tryLinkMove(const std::string &source, const std::string &destination, TransferError &error);

    static bool copyViaTemporary(const std::string &source, const std::string &destination, TransferError &error);

    static bool publish(const std::string &temporary, const std::string &destination, TransferError &error);
};
