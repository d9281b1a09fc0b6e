#include "core/work_coordinator.hpp"
#include "core/date_resolver.hpp"
#include "core/file_classifier.hpp"
#include "core/file_mover.hpp"
#include "core/placement_planner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <unistd.h>

WorkCoordinator::WorkCoordinator(const OrganizerConfig &config)
    : WorkCoordinator(config, ExtractorRegistry::createDefault(config.extraction, config.date_policy))
{
}

WorkCoordinator::WorkCoordinator(const OrganizerConfig &config, ExtractorRegistry registry)
    : config_(config), registry_(std::move(registry))
{
    if (config_.concurrency < 1)
    {
        Logger::warn("Concurrency " + std::to_string(config_.concurrency) + " is invalid, using 1");
        config_.concurrency = 1;
    }
}

WorkCoordinator::~WorkCoordinator()
{
    cancelled_.store(true);
    Logger::debug("WorkCoordinator destructor called");
}

void WorkCoordinator::cancel()
{
    if (!cancelled_.exchange(true))
    {
        Logger::info("Cancellation requested, finishing files in flight");
    }
}

RunSummary WorkCoordinator::getSummary() const
{
    std::lock_guard<std::mutex> lock(summary_mutex_);
    return summary_;
}

bool WorkCoordinator::isJunkFile(const std::string &file_path) const
{
    std::string name = FileUtils::toLower(fs::path(file_path).filename().string());
    const auto &junk = config_.cleanup.junk_file_names;
    return std::any_of(junk.begin(), junk.end(), [&name](const std::string &junk_name)
                       { return FileUtils::toLower(junk_name) == name; });
}

void WorkCoordinator::validateRoots() const
{
    if (config_.source_dir.empty() || !FileUtils::isValidDirectory(config_.source_dir) ||
        ::access(config_.source_dir.c_str(), R_OK | X_OK) != 0)
    {
        throw std::runtime_error("Source directory is not a readable directory: " + config_.source_dir);
    }
    if (config_.destination_dir.empty())
    {
        throw std::runtime_error("Destination directory is not set");
    }

    std::error_code ec;
    fs::create_directories(config_.destination_dir, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create destination directory " + config_.destination_dir + ": " + ec.message());
    }
    if (!FileUtils::isWritableDirectory(config_.destination_dir))
    {
        throw std::runtime_error("Destination directory is not writable: " + config_.destination_dir);
    }
}

bool WorkCoordinator::isInsideDestination(const fs::path &directory) const
{
    std::error_code ec;
    return fs::equivalent(directory, config_.destination_dir, ec);
}

void WorkCoordinator::collectSourceFiles(std::vector<std::string> &media_files, std::vector<std::string> &junk_files) const
{
    FileUtils::scanDirectoryRecursively(
        config_.source_dir,
        [&](const std::string &file_path)
        {
            if (isJunkFile(file_path))
            {
                junk_files.push_back(file_path);
            }
            else
            {
                media_files.push_back(file_path);
            }
        },
        [this](const fs::path &directory)
        { return isInsideDestination(directory); });

    std::sort(media_files.begin(), media_files.end());
}

ProcessingResult WorkCoordinator::processFile(const std::string &file_path,
                                              const DateResolver &resolver,
                                              PlacementPlanner &planner,
                                              const FileMover &mover) const
{
    auto start = std::chrono::steady_clock::now();

    auto metadata = FileUtils::getFileMetadata(file_path);
    if (!metadata)
    {
        return ProcessingResult::failure(file_path, ErrorKind::SOURCE_UNREADABLE, "Cannot stat source file");
    }
    auto prefix = FileUtils::readFilePrefix(file_path, FileClassifier::SNIFF_BYTES);
    if (!prefix)
    {
        return ProcessingResult::failure(file_path, ErrorKind::SOURCE_UNREADABLE, "Cannot open source file");
    }

    MediaFile file(file_path, FileClassifier::classify(file_path, *prefix), metadata->file_size, metadata->modification_time);

    ResolvedDate date;
    ErrorKind note = ErrorKind::NONE;
    if (file.kind == MediaKind::UNSUPPORTED)
    {
        date = ResolvedDate::unresolved();
        note = ErrorKind::UNSUPPORTED_FORMAT;
    }
    else
    {
        date = resolver.resolve(file);
        if (!date.resolved || date.isLowConfidence())
        {
            note = ErrorKind::METADATA_UNREADABLE;
        }
    }

    PlacementDecision decision = planner.plan(file, date);

    ProcessingResult result;
    if (config_.dry_run)
    {
        result.source_path = file.path;
        result.success = true;
        result.has_decision = true;
        result.decision = decision;
    }
    else
    {
        result = mover.apply(decision, file);
        if (!result.success)
        {
            planner.release(decision);
        }
    }

    result.kind = file.kind;
    result.resolved_date = date;
    if (result.success)
    {
        result.error_kind = note;
    }
    result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
    return result;
}

void WorkCoordinator::recordResult(const ProcessingResult &result)
{
    processed_count_.fetch_add(1);

    std::lock_guard<std::mutex> lock(summary_mutex_);
    summary_.processed++;
    if (!result.success)
    {
        failed_count_.fetch_add(1);
        summary_.failed++;
        return;
    }

    succeeded_count_.fetch_add(1);
    if (result.kind == MediaKind::UNSUPPORTED)
    {
        summary_.unsupported++;
    }
    else if (!result.resolved_date.resolved)
    {
        summary_.unresolved_date++;
    }
    else if (result.resolved_date.isLowConfidence())
    {
        summary_.low_confidence++;
    }

    if (result.decision.action == PlacementAction::SKIP_DUPLICATE)
    {
        skipped_count_.fetch_add(1);
        summary_.skipped_duplicate++;
        return;
    }
    if (result.decision.action == PlacementAction::RENAME_SUFFIX)
    {
        summary_.renamed++;
    }

    if (config_.dry_run)
    {
        summary_.planned++;
    }
    else if (result.decision.transfer == TransferMode::MOVE)
    {
        summary_.moved++;
    }
    else
    {
        summary_.copied++;
    }
}

void WorkCoordinator::cleanupSource(const std::vector<std::string> &junk_files)
{
    if (config_.dry_run || config_.transfer_mode != TransferMode::MOVE)
    {
        return;
    }

    size_t junk_deleted = 0;
    if (config_.cleanup.delete_junk_files)
    {
        for (const auto &junk : junk_files)
        {
            std::error_code ec;
            if (fs::remove(junk, ec))
            {
                ++junk_deleted;
                Logger::debug("Deleted junk file: " + junk);
            }
            else if (ec)
            {
                Logger::warn("Could not delete junk file " + junk + ": " + ec.message());
            }
        }
    }

    size_t dirs_removed = 0;
    if (config_.cleanup.remove_empty_dirs)
    {
        // A destination nested in the source keeps its own empty directories
        std::error_code ec;
        fs::path source = fs::weakly_canonical(config_.source_dir, ec);
        fs::path destination = fs::weakly_canonical(config_.destination_dir, ec);
        std::string relative = destination.lexically_relative(source).string();
        bool nested = !ec && !relative.empty() && relative.compare(0, 2, "..") != 0;
        if (nested)
        {
            Logger::info("Destination is inside the source tree, skipping empty directory removal");
        }
        else
        {
            dirs_removed = FileUtils::removeEmptyDirectories(config_.source_dir);
        }
    }

    std::lock_guard<std::mutex> lock(summary_mutex_);
    summary_.junk_deleted = junk_deleted;
    summary_.empty_dirs_removed = dirs_removed;
}

SimpleObservable<ProcessingResult> WorkCoordinator::run()
{
    return SimpleObservable<ProcessingResult>([this](auto onNext, auto onError, auto onComplete)
                                              {
        if (started_.exchange(true))
        {
            Logger::error("WorkCoordinator::run subscribed more than once");
            if (onError) onError(std::logic_error("Run already started; results cannot be replayed"));
            return;
        }

        auto abortRun = [&](const std::exception &e)
        {
            cancelled_.store(true);
            {
                std::lock_guard<std::mutex> lock(summary_mutex_);
                summary_.aborted = true;
                summary_.abort_reason = e.what();
            }
            Logger::error(std::string("Run aborted: ") + e.what());
            if (onError) onError(e);
        };

        try
        {
            validateRoots();
        }
        catch (const std::exception &e)
        {
            abortRun(e);
            return;
        }

        std::vector<std::string> media_files;
        std::vector<std::string> junk_files;
        collectSourceFiles(media_files, junk_files);
        total_count_.store(media_files.size());
        {
            std::lock_guard<std::mutex> lock(summary_mutex_);
            summary_.total_files = media_files.size();
        }

        Logger::info("Organizing " + std::to_string(media_files.size()) + " files from " + config_.source_dir +
                     " into " + config_.destination_dir + " with " + std::to_string(config_.concurrency) + " workers" +
                     (config_.dry_run ? " (dry run)" : ""));

        DateResolver resolver(registry_, config_.date_policy);
        PlacementPlanner planner(config_.destination_dir, config_.transfer_mode);
        FileMover mover;
        std::mutex emit_mutex;

        try
        {
            tbb::task_arena arena(config_.concurrency);
            arena.execute([&]()
                          {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, media_files.size(), 1),
                                  [&](const tbb::blocked_range<size_t> &range)
                                  {
                    for (size_t i = range.begin(); i != range.end(); ++i)
                    {
                        if (cancelled_.load())
                        {
                            return;
                        }

                        ProcessingResult result = processFile(media_files[i], resolver, planner, mover);
                        recordResult(result);

                        if (result.success)
                        {
                            Logger::info(result.source_path + " -> " + result.decision.relative_path + " [" +
                                         placementActionName(result.decision.action) + ", " +
                                         (result.resolved_date.resolved ? result.resolved_date.strategy : "no date") + "]");
                        }
                        else
                        {
                            Logger::error("Failed to organize " + result.source_path + " (" +
                                          errorKindName(result.error_kind) + "): " + result.error_message);
                        }

                        {
                            std::lock_guard<std::mutex> lock(emit_mutex);
                            if (onNext) onNext(result);
                        }

                        if (result.error_kind == ErrorKind::DESTINATION_WRITE_FAILED &&
                            !FileUtils::isWritableDirectory(config_.destination_dir))
                        {
                            throw std::runtime_error("Destination directory is no longer writable: " + config_.destination_dir);
                        }
                    }
                }); });
        }
        catch (const std::exception &e)
        {
            abortRun(e);
            return;
        }

        bool was_cancelled = cancelled_.load();
        if (!was_cancelled)
        {
            cleanupSource(junk_files);
        }

        RunSummary summary;
        {
            std::lock_guard<std::mutex> lock(summary_mutex_);
            summary_.cancelled = was_cancelled;
            summary = summary_;
        }

        Logger::info("Run " + std::string(was_cancelled ? "cancelled" : "complete") +
                     ": processed=" + std::to_string(summary.processed) +
                     " moved=" + std::to_string(summary.moved) +
                     " copied=" + std::to_string(summary.copied) +
                     " planned=" + std::to_string(summary.planned) +
                     " skipped-duplicate=" + std::to_string(summary.skipped_duplicate) +
                     " renamed=" + std::to_string(summary.renamed) +
                     " unresolved-date=" + std::to_string(summary.unresolved_date) +
                     " low-confidence=" + std::to_string(summary.low_confidence) +
                     " unsupported=" + std::to_string(summary.unsupported) +
                     " failed=" + std::to_string(summary.failed));

        if (onComplete) onComplete(); });
}
