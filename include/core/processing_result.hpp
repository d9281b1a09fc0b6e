#pragma once

#include <cstddef>
#include <string>
#include "core/date_types.hpp"
#include "core/media_kind.hpp"

/**
 * @brief Error taxonomy for per-file and run-level failures
 */
enum class ErrorKind
{
    NONE,
    UNSUPPORTED_FORMAT,      // Routed to Unknown/, not a failure of the run
    METADATA_UNREADABLE,     // Filesystem time fallback used, informational
    SOURCE_UNREADABLE,       // Per-file failure, source untouched
    DESTINATION_CONFLICT,    // Destination occupied behind the planner's back
    DESTINATION_WRITE_FAILED // Disk full, permission denied, path too long
};

inline std::string errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:
        return "None";
    case ErrorKind::UNSUPPORTED_FORMAT:
        return "UnsupportedFormat";
    case ErrorKind::METADATA_UNREADABLE:
        return "MetadataUnreadable";
    case ErrorKind::SOURCE_UNREADABLE:
        return "SourceUnreadable";
    case ErrorKind::DESTINATION_CONFLICT:
        return "DestinationConflict";
    case ErrorKind::DESTINATION_WRITE_FAILED:
        return "DestinationWriteFailed";
    default:
        return "Unknown";
    }
}

enum class PlacementAction
{
    MOVE,
    COPY,
    SKIP_DUPLICATE,
    RENAME_SUFFIX
};

inline std::string placementActionName(PlacementAction action)
{
    switch (action)
    {
    case PlacementAction::MOVE:
        return "move";
    case PlacementAction::COPY:
        return "copy";
    case PlacementAction::SKIP_DUPLICATE:
        return "skip-duplicate";
    case PlacementAction::RENAME_SUFFIX:
        return "rename-suffix";
    default:
        return "unknown";
    }
}

enum class TransferMode
{
    MOVE,
    COPY
};

/**
 * @brief Where a file goes and how it gets there
 */
struct PlacementDecision
{
    std::string relative_path;    // "2023/03/IMG_0005.JPG" or "Unknown/notes.txt"
    std::string destination_path; // Absolute destination path
    PlacementAction action = PlacementAction::MOVE;
    TransferMode transfer = TransferMode::MOVE; // Byte transfer used by MOVE/COPY/RENAME_SUFFIX
    std::string collision_reason;               // Empty when the first slot was free
};

/**
 * @brief Terminal record for one file
 */
struct ProcessingResult
{
    std::string source_path;
    bool success;
    ErrorKind error_kind;
    std::string error_message;
    MediaKind kind;
    ResolvedDate resolved_date;
    bool has_decision;
    PlacementDecision decision;
    bool applied;         // False for dry runs and skip-duplicate
    long long processing_time_ms = 0;

    ProcessingResult() : success(false), error_kind(ErrorKind::NONE), kind(MediaKind::UNSUPPORTED), has_decision(false), applied(false) {}
    ProcessingResult(bool s, const std::string &msg = "")
        : success(s), error_kind(ErrorKind::NONE), error_message(msg), kind(MediaKind::UNSUPPORTED), has_decision(false), applied(false) {}

    static ProcessingResult failure(const std::string &source, ErrorKind kind, const std::string &msg)
    {
        ProcessingResult result(false, msg);
        result.source_path = source;
        result.error_kind = kind;
        return result;
    }
};

/**
 * @brief Aggregated counts for one run
 */
struct RunSummary
{
    size_t total_files = 0;
    size_t processed = 0;
    size_t moved = 0;
    size_t copied = 0;
    size_t planned = 0; // Dry-run decisions that would transfer data
    size_t skipped_duplicate = 0;
    size_t renamed = 0; // Subset of moved/copied/planned that needed a suffix
    size_t unresolved_date = 0;
    size_t low_confidence = 0;
    size_t unsupported = 0;
    size_t failed = 0;
    size_t junk_deleted = 0;
    size_t empty_dirs_removed = 0;
    bool cancelled = false;
    bool aborted = false;
    std::string abort_reason;
};
