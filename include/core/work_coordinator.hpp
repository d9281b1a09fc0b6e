#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/extractor_registry.hpp"
#include "core/file_utils.hpp"
#include "core/organizer_config.hpp"
#include "core/processing_result.hpp"

class DateResolver;
class FileMover;
class PlacementPlanner;

/**
 * @brief Drives every source file through classify, resolve, plan and move.
 *
 * Error Handling Policy:
 * - Per-file failures are emitted via onNext with success=false and never stop other files.
 * - Fatal conditions (invalid source root, unusable destination root, collision
 *   index invariant violation) cancel the remaining dispatch and are emitted via onError.
 * - Cancellation is cooperative: files already in flight finish, no new file starts.
 *
 * A coordinator runs once; subscribing a second time reports an error.
 */
class WorkCoordinator
{
public:
    explicit WorkCoordinator(const OrganizerConfig &config);

    // Custom strategy set, used by tests and embedders
    WorkCoordinator(const OrganizerConfig &config, ExtractorRegistry registry);

    ~WorkCoordinator();

    /**
     * @brief Lazy, finite stream of per-file results
     *
     * Work starts when the stream is subscribed and the call returns once the
     * run is over. onNext calls are serialized.
     */
    SimpleObservable<ProcessingResult> run();

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    // Running counters, safe to read from any thread during the run
    size_t getProcessedCount() const { return processed_count_.load(); }
    size_t getSucceededCount() const { return succeeded_count_.load(); }
    size_t getFailedCount() const { return failed_count_.load(); }
    size_t getSkippedCount() const { return skipped_count_.load(); }
    size_t getTotalCount() const { return total_count_.load(); }

    /**
     * @brief Summary of the finished (or aborted) run
     */
    RunSummary getSummary() const;

    bool isJunkFile(const std::string &file_path) const;

private:
    OrganizerConfig config_;
    ExtractorRegistry registry_;

    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};

    std::atomic<size_t> total_count_{0};
    std::atomic<size_t> processed_count_{0};
    std::atomic<size_t> succeeded_count_{0};
    std::atomic<size_t> failed_count_{0};
    std::atomic<size_t> skipped_count_{0};

    mutable std::mutex summary_mutex_;
    RunSummary summary_;

    void validateRoots() const;
    bool isInsideDestination(const fs::path &directory) const;
    void collectSourceFiles(std::vector<std::string> &media_files, std::vector<std::string> &junk_files) const;

    ProcessingResult processFile(const std::string &file_path,
                                 const DateResolver &resolver,
                                 PlacementPlanner &planner,
                                 const FileMover &mover) const;

    void recordResult(const ProcessingResult &result);
    void cleanupSource(const std::vector<std::string> &junk_files);
};
