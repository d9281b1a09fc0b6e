#include "core/placement_planner.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    const std::string SOURCE_KEY_PREFIX = "source:";

    bool isTransferTemporary(const std::string &file_name)
    {
        const std::string suffix = ".partial";
        return !file_name.empty() && file_name[0] == '.' && file_name.size() > suffix.size() &&
               file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

PlacementPlanner::PlacementPlanner(const std::string &destination_root, TransferMode transfer)
    : destination_root_(destination_root), transfer_(transfer)
{
}

std::string PlacementPlanner::relativeDirectory(const ResolvedDate &date)
{
    if (!date.resolved)
    {
        return UNKNOWN_DIRECTORY;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d/%02d", date.date.year, date.date.month);
    return buf;
}

std::string PlacementPlanner::suffixedName(const std::string &file_name, int n)
{
    fs::path name(file_name);
    std::string stem = name.stem().string();
    std::string extension = name.extension().string();
    return stem + "_" + std::to_string(n) + extension;
}

void PlacementPlanner::indexExistingDirectory(const std::string &directory)
{
    if (!indexed_directories_.insert(directory).second)
    {
        return;
    }

    std::error_code ec;
    if (!fs::is_directory(directory, ec))
    {
        return;
    }

    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec))
            continue;

        std::string name = it->path().filename().string();
        if (isTransferTemporary(name))
            continue;

        Occupant occupant;
        occupant.destination_path = it->path().string();
        occupant.size = it->file_size(entry_ec);
        if (entry_ec)
            continue;
        occupant.generation = ++next_generation_;

        index_.emplace(occupant.destination_path, occupant);
        directory_members_[directory].insert(occupant.destination_path);
    }
    if (ec)
    {
        Logger::warn("Could not fully index existing destination directory " + directory + ": " + ec.message());
    }
}

PlacementPlanner::HashJob PlacementPlanner::hashJobFor(const Occupant &occupant) const
{
    HashJob job;
    job.cache_key = occupant.destination_path;
    job.generation = occupant.generation;
    if (occupant.source_path.empty())
    {
        job.primary_path = occupant.destination_path;
        return job;
    }

    // A reserved file may still be at its source or already at its destination
    std::error_code ec;
    if (fs::exists(occupant.destination_path, ec))
    {
        job.primary_path = occupant.destination_path;
        job.fallback_path = occupant.source_path;
    }
    else
    {
        job.primary_path = occupant.source_path;
        job.fallback_path = occupant.destination_path;
    }
    return job;
}

bool PlacementPlanner::isCurrent(const HashJob &job) const
{
    if (job.generation == 0)
    {
        return true;
    }
    auto it = index_.find(job.cache_key);
    return it != index_.end() && it->second.generation == job.generation;
}

std::string PlacementPlanner::hashWithFallback(const HashJob &job)
{
    std::string hash = FileUtils::computeFileHash(job.primary_path);
    if (hash.empty() && !job.fallback_path.empty())
    {
        hash = FileUtils::computeFileHash(job.fallback_path);
    }
    return hash;
}

PlacementDecision PlacementPlanner::plan(const MediaFile &file, const ResolvedDate &date)
{
    const std::string relative_dir = relativeDirectory(date);
    const std::string directory = (fs::path(destination_root_) / relative_dir).string();
    const std::string file_name = fs::path(file.path).filename().string();
    const std::string source_key = SOURCE_KEY_PREFIX + file.path;

    PlacementDecision decision;
    decision.transfer = transfer_;

    while (true)
    {
        std::vector<HashJob> jobs;
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            indexExistingDirectory(directory);

            // Same-size neighbours in the target directory are duplicate candidates
            bool duplicate_check_complete = true;
            for (const auto &member : directory_members_[directory])
            {
                const Occupant &occupant = index_.at(member);
                if (occupant.size != file.size || occupant.source_path == file.path)
                    continue;

                auto source_hash = hash_cache_.find(source_key);
                auto occupant_hash = hash_cache_.find(occupant.destination_path);
                if (source_hash == hash_cache_.end() || occupant_hash == hash_cache_.end())
                {
                    if (source_hash == hash_cache_.end())
                    {
                        jobs.push_back(HashJob{source_key, file.path, ""});
                    }
                    if (occupant_hash == hash_cache_.end())
                    {
                        jobs.push_back(hashJobFor(occupant));
                    }
                    duplicate_check_complete = false;
                    break;
                }

                if (!source_hash->second.empty() && source_hash->second == occupant_hash->second)
                {
                    std::string existing_name = fs::path(occupant.destination_path).filename().string();
                    decision.relative_path = relative_dir + "/" + existing_name;
                    decision.destination_path = occupant.destination_path;
                    decision.action = PlacementAction::SKIP_DUPLICATE;
                    decision.collision_reason = "identical content already at " + decision.relative_path;
                    return decision;
                }
            }

            if (duplicate_check_complete)
            {
                std::string collision_reason;
                for (int n = 0;; ++n)
                {
                    std::string candidate_name = (n == 0) ? file_name : suffixedName(file_name, n);
                    std::string candidate_path = (fs::path(directory) / candidate_name).string();
                    if (index_.count(candidate_path) > 0)
                    {
                        if (collision_reason.empty())
                        {
                            collision_reason = file_name + " occupied by different content";
                        }
                        continue;
                    }

                    reserveLocked(candidate_path, file);
                    auto source_hash = hash_cache_.find(source_key);
                    if (source_hash != hash_cache_.end() && !source_hash->second.empty())
                    {
                        hash_cache_[candidate_path] = source_hash->second;
                    }

                    decision.relative_path = relative_dir + "/" + candidate_name;
                    decision.destination_path = candidate_path;
                    decision.collision_reason = collision_reason;
                    if (n > 0)
                    {
                        decision.action = PlacementAction::RENAME_SUFFIX;
                    }
                    else
                    {
                        decision.action = (transfer_ == TransferMode::COPY) ? PlacementAction::COPY : PlacementAction::MOVE;
                    }
                    return decision;
                }
            }
        }

        // Hash outside the lock, then re-evaluate against the current index
        for (const auto &job : jobs)
        {
            std::string hash = hashWithFallback(job);
            if (hash.empty())
            {
                Logger::debug("Could not hash " + job.primary_path + " for duplicate check");
            }
            std::lock_guard<std::mutex> lock(index_mutex_);
            // The occupant may have been released or replaced while we hashed
            if (!isCurrent(job))
            {
                Logger::debug("Discarding hash of " + job.cache_key + ", occupant changed");
                continue;
            }
            hash_cache_.emplace(job.cache_key, hash);
        }
    }
}

void PlacementPlanner::reserveLocked(const std::string &destination_path, const MediaFile &file)
{
    if (index_.count(destination_path) > 0)
    {
        throw DestinationConflictError(destination_path);
    }

    Occupant occupant;
    occupant.destination_path = destination_path;
    occupant.source_path = file.path;
    occupant.size = file.size;
    occupant.generation = ++next_generation_;
    index_.emplace(destination_path, occupant);
    directory_members_[fs::path(destination_path).parent_path().string()].insert(destination_path);
}

void PlacementPlanner::reserve(const std::string &destination_path, const MediaFile &file)
{
    std::lock_guard<std::mutex> lock(index_mutex_);
    reserveLocked(destination_path, file);
}

void PlacementPlanner::release(const PlacementDecision &decision)
{
    if (decision.action == PlacementAction::SKIP_DUPLICATE)
    {
        return;
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = index_.find(decision.destination_path);
    if (it == index_.end() || it->second.source_path.empty())
    {
        return;
    }

    std::error_code ec;
    uint64_t size_on_disk = fs::file_size(decision.destination_path, ec);
    if (!ec)
    {
        it->second.source_path.clear();
        it->second.size = size_on_disk;
        it->second.generation = ++next_generation_;
        hash_cache_.erase(decision.destination_path);
        Logger::warn("Keeping " + decision.destination_path + " as occupied, a file remains there after the failed transfer");
        return;
    }

    index_.erase(it);
    directory_members_[fs::path(decision.destination_path).parent_path().string()].erase(decision.destination_path);
    hash_cache_.erase(decision.destination_path);
    Logger::debug("Released reservation for " + decision.destination_path);
}

bool PlacementPlanner::isReserved(const std::string &destination_path) const
{
    std::lock_guard<std::mutex> lock(index_mutex_);
    return index_.count(destination_path) > 0;
}

size_t PlacementPlanner::getReservationCount() const
{
    std::lock_guard<std::mutex> lock(index_mutex_);
    size_t count = 0;
    for (const auto &entry : index_)
    {
        if (!entry.second.source_path.empty())
            ++count;
    }
    return count;
}
