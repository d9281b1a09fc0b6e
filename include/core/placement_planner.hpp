#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/date_types.hpp"
#include "core/media_file.hpp"
#include "core/processing_result.hpp"

/**
 * @brief Raised when the collision index is asked to hand out a path twice
 *
 * This is a bug in the planner, never a runtime condition; the coordinator
 * aborts the run when it sees one.
 */
class DestinationConflictError : public std::logic_error
{
public:
    explicit DestinationConflictError(const std::string &destination_path)
        : std::logic_error("Destination already reserved: " + destination_path) {}
};

/**
 * @brief Turns a resolved date into a destination and arbitrates collisions
 *
 * Holds the run's collision index: every destination path that is either
 * already on disk or reserved by a planned transfer. Check-and-reserve is one
 * step under the index mutex. Content hashes are only computed when a
 * same-size occupant exists in the target directory, outside the lock, and
 * memoized for the rest of the run.
 */
class PlacementPlanner
{
public:
    PlacementPlanner(const std::string &destination_root, TransferMode transfer);

    /**
     * @brief Plan one file
     *
     * Identical content already present (or reserved) in the target directory
     * yields SKIP_DUPLICATE. Otherwise the first free name among basename,
     * basename_1, basename_2, ... is reserved.
     */
    PlacementDecision plan(const MediaFile &file, const ResolvedDate &date);

    /**
     * @brief Drop a reservation whose transfer did not happen
     *
     * If a file nevertheless sits at the destination the entry stays in the
     * index as an on-disk occupant, so the name is never handed out again.
     */
    void release(const PlacementDecision &decision);

    /**
     * @brief Reserve a destination path for a file
     * @throws DestinationConflictError if the path is already in the index
     */
    void reserve(const std::string &destination_path, const MediaFile &file);

    bool isReserved(const std::string &destination_path) const;

    size_t getReservationCount() const;

    // "YYYY/MM" or "Unknown"
    static std::string relativeDirectory(const ResolvedDate &date);

    // name_1.ext for n == 1
    static std::string suffixedName(const std::string &file_name, int n);

    static constexpr const char *UNKNOWN_DIRECTORY = "Unknown";

private:
    struct Occupant
    {
        std::string destination_path;
        std::string source_path; // Empty for files found on disk
        uint64_t size = 0;
        uint64_t generation = 0; // Changes whenever the entry is re-created or converted
    };

    struct HashJob
    {
        std::string cache_key;
        std::string primary_path;
        std::string fallback_path;
        uint64_t generation = 0; // 0 for source hashes
    };

    std::string destination_root_;
    TransferMode transfer_;

    mutable std::mutex index_mutex_;
    std::map<std::string, Occupant> index_;
    std::map<std::string, std::set<std::string>> directory_members_;
    std::set<std::string> indexed_directories_;
    std::map<std::string, std::string> hash_cache_;
    uint64_t next_generation_ = 0;

    void indexExistingDirectory(const std::string &directory);
    void reserveLocked(const std::string &destination_path, const MediaFile &file);
    HashJob hashJobFor(const Occupant &occupant) const;
    bool isCurrent(const HashJob &job) const;
    static std::string hashWithFallback(const HashJob &job);
};
