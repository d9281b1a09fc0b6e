#include <gtest/gtest.h>
#include "core/extractors/filename_date_strategy.hpp"
#include "core/work_coordinator.hpp"
#include "test_base.hpp"
#include <map>
#include <set>

namespace fs = std::filesystem;

class WorkCoordinatorTest : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        source_ = root_ / "incoming";
        destination_ = root_ / "library";
        fs::create_directories(source_);
    }

    // Embedded tags come from the file body; videos behave as if no probe and no container date exist
    static ExtractorRegistry testRegistry()
    {
        ExtractionConfig extraction;
        auto tag = std::make_shared<EmbeddedTagStrategy>();
        auto filename = std::make_shared<FilenameDateStrategy>(extraction.filename_patterns, DatePolicy());
        auto probe = std::make_shared<FixedOutcomeStrategy>("ffprobe", ConfidenceTier::CONTAINER,
                                                            ExtractionOutcome::failed("ffprobe not available"));
        auto container = std::make_shared<FixedOutcomeStrategy>("ffmpeg_container", ConfidenceTier::CONTAINER,
                                                                ExtractionOutcome::noDate());

        ExtractorRegistry registry;
        for (MediaKind kind : MediaKinds::getAllKinds())
        {
            if (MediaKinds::isVideo(kind))
            {
                registry.registerStrategy(kind, probe);
                registry.registerStrategy(kind, container);
            }
            else
            {
                registry.registerStrategy(kind, tag);
            }
            registry.registerStrategy(kind, filename);
        }
        return registry;
    }

    OrganizerConfig config(TransferMode mode, const fs::path &destination) const
    {
        OrganizerConfig cfg;
        cfg.source_dir = source_.string();
        cfg.destination_dir = destination.string();
        cfg.transfer_mode = mode;
        cfg.concurrency = 1;
        return cfg;
    }

    struct RunOutput
    {
        std::vector<ProcessingResult> results;
        std::string error;
        bool completed = false;
        RunSummary summary;
    };

    RunOutput runWith(const OrganizerConfig &cfg)
    {
        WorkCoordinator coordinator(cfg, testRegistry());
        return runWith(coordinator);
    }

    static RunOutput runWith(WorkCoordinator &coordinator)
    {
        RunOutput output;
        coordinator.run().subscribe(
            [&output](const ProcessingResult &result)
            { output.results.push_back(result); },
            [&output](const std::exception &e)
            { output.error = e.what(); },
            [&output]()
            { output.completed = true; });
        output.summary = coordinator.getSummary();
        return output;
    }

    static const ProcessingResult *find(const RunOutput &output, const std::string &file_name)
    {
        for (const auto &result : output.results)
        {
            if (fs::path(result.source_path).filename() == file_name)
                return &result;
        }
        return nullptr;
    }

    static std::map<std::string, std::string> snapshot(const fs::path &dir)
    {
        std::map<std::string, std::string> tree;
        for (const auto &entry : fs::recursive_directory_iterator(dir))
        {
            if (entry.is_regular_file())
                tree[fs::relative(entry.path(), dir).string()] = readFile(entry.path());
        }
        return tree;
    }

    void writeScenario()
    {
        writeFile("incoming/IMG_0005.JPG", "\xFF\xD8\xFF DateTimeOriginal=2023:03:14 09:41:00 jpeg");
        writeFile("incoming/copy_of_IMG_0005.JPG", "\xFF\xD8\xFF DateTimeOriginal=2023:03:14 09:41:00 jpeg");
        writeFile("incoming/VID_20220101_120000.mov", "no container metadata here");
        writeFile("incoming/notes.txt", "shopping list");
    }

    fs::path source_;
    fs::path destination_;
};

TEST_F(WorkCoordinatorTest, ReferenceScenarios)
{
    writeScenario();
    RunOutput output = runWith(config(TransferMode::COPY, destination_));

    ASSERT_TRUE(output.error.empty()) << output.error;
    EXPECT_TRUE(output.completed);
    ASSERT_EQ(output.results.size(), 4u);

    const auto *img = find(output, "IMG_0005.JPG");
    ASSERT_NE(img, nullptr);
    EXPECT_TRUE(img->success);
    EXPECT_EQ(img->decision.relative_path, "2023/03/IMG_0005.JPG");
    EXPECT_EQ(img->resolved_date.strategy, "exif");

    const auto *copy = find(output, "copy_of_IMG_0005.JPG");
    ASSERT_NE(copy, nullptr);
    EXPECT_TRUE(copy->success);
    EXPECT_EQ(copy->decision.action, PlacementAction::SKIP_DUPLICATE);
    EXPECT_FALSE(fs::exists(destination_ / "2023/03/copy_of_IMG_0005.JPG"));

    const auto *video = find(output, "VID_20220101_120000.mov");
    ASSERT_NE(video, nullptr);
    EXPECT_EQ(video->kind, MediaKind::QUICKTIME);
    EXPECT_EQ(video->resolved_date.strategy, "filename");
    EXPECT_EQ(video->decision.relative_path, "2022/01/VID_20220101_120000.mov");

    const auto *notes = find(output, "notes.txt");
    ASSERT_NE(notes, nullptr);
    EXPECT_TRUE(notes->success);
    EXPECT_EQ(notes->error_kind, ErrorKind::UNSUPPORTED_FORMAT);
    EXPECT_EQ(notes->decision.relative_path, "Unknown/notes.txt");

    EXPECT_TRUE(fs::exists(destination_ / "2023/03/IMG_0005.JPG"));
    EXPECT_TRUE(fs::exists(destination_ / "2022/01/VID_20220101_120000.mov"));
    EXPECT_TRUE(fs::exists(destination_ / "Unknown/notes.txt"));
    EXPECT_TRUE(fs::exists(source_ / "IMG_0005.JPG"));

    EXPECT_EQ(output.summary.total_files, 4u);
    EXPECT_EQ(output.summary.copied, 3u);
    EXPECT_EQ(output.summary.skipped_duplicate, 1u);
    EXPECT_EQ(output.summary.unsupported, 1u);
    EXPECT_EQ(output.summary.failed, 0u);
}

TEST_F(WorkCoordinatorTest, MoveModeEmptiesTheSource)
{
    writeFile("incoming/trip/IMG_0005.JPG", "\xFF\xD8\xFF DateTimeOriginal=2023:03:14 09:41:00");
    writeFile("incoming/trip/Thumbs.db", "thumbnail cache");
    writeFile("incoming/trip/day2/.DS_Store", "finder");

    RunOutput output = runWith(config(TransferMode::MOVE, destination_));

    ASSERT_TRUE(output.error.empty()) << output.error;
    EXPECT_EQ(output.results.size(), 1u);
    EXPECT_EQ(output.summary.moved, 1u);
    EXPECT_EQ(output.summary.junk_deleted, 2u);
    EXPECT_EQ(output.summary.empty_dirs_removed, 2u);
    EXPECT_TRUE(fs::exists(destination_ / "2023/03/IMG_0005.JPG"));
    EXPECT_FALSE(fs::exists(source_ / "trip"));
    EXPECT_TRUE(fs::exists(source_));
}

TEST_F(WorkCoordinatorTest, DryRunChangesNothing)
{
    writeScenario();
    OrganizerConfig cfg = config(TransferMode::MOVE, destination_);
    cfg.dry_run = true;

    RunOutput output = runWith(cfg);

    ASSERT_TRUE(output.error.empty()) << output.error;
    ASSERT_EQ(output.results.size(), 4u);
    for (const auto &result : output.results)
    {
        EXPECT_TRUE(result.success);
        EXPECT_TRUE(result.has_decision);
        EXPECT_FALSE(result.applied);
    }
    EXPECT_EQ(output.summary.planned, 3u);
    EXPECT_EQ(output.summary.moved, 0u);
    EXPECT_EQ(output.summary.skipped_duplicate, 1u);
    EXPECT_TRUE(snapshot(destination_).empty());
    EXPECT_EQ(snapshot(source_).size(), 4u);
}

TEST_F(WorkCoordinatorTest, SecondRunOnlyFindsDuplicates)
{
    writeScenario();
    RunOutput first = runWith(config(TransferMode::COPY, destination_));
    ASSERT_EQ(first.summary.failed, 0u);
    auto before = snapshot(destination_);

    RunOutput second = runWith(config(TransferMode::COPY, destination_));

    ASSERT_EQ(second.results.size(), 4u);
    for (const auto &result : second.results)
    {
        EXPECT_EQ(result.decision.action, PlacementAction::SKIP_DUPLICATE) << result.source_path;
    }
    EXPECT_EQ(second.summary.skipped_duplicate, 4u);
    EXPECT_EQ(snapshot(destination_), before);
}

TEST_F(WorkCoordinatorTest, CleanRunsAreByteIdentical)
{
    writeScenario();
    writeFile("incoming/a/IMG_0001.JPG", "\xFF\xD8\xFF DateTimeOriginal=2021:08:01 10:00:00 first");
    writeFile("incoming/b/IMG_0001.JPG", "\xFF\xD8\xFF DateTimeOriginal=2021:08:01 10:00:00 second");

    RunOutput one = runWith(config(TransferMode::COPY, root_ / "out1"));
    RunOutput two = runWith(config(TransferMode::COPY, root_ / "out2"));

    auto tree = snapshot(root_ / "out1");
    EXPECT_EQ(tree, snapshot(root_ / "out2"));
    EXPECT_EQ(tree.count("2021/08/IMG_0001.JPG"), 1u);
    EXPECT_EQ(tree.count("2021/08/IMG_0001_1.JPG"), 1u);
    EXPECT_EQ(one.summary.renamed, 1u);
    EXPECT_EQ(two.summary.renamed, 1u);
}

TEST_F(WorkCoordinatorTest, ParallelCleanRunsPlaceTheSameNamesAndContents)
{
    writeFile("incoming/VID_20220101_120000.mov", "no container metadata here");
    for (int i = 0; i < 6; ++i)
    {
        writeFile("incoming/card" + std::to_string(i) + "/IMG_0001.JPG",
                  "\xFF\xD8\xFF DateTimeOriginal=2021:08:01 10:00:00 #" + std::to_string(i));
    }
    OrganizerConfig first = config(TransferMode::COPY, root_ / "out1");
    OrganizerConfig second = config(TransferMode::COPY, root_ / "out2");
    first.concurrency = 4;
    second.concurrency = 4;

    RunOutput one = runWith(first);
    RunOutput two = runWith(second);

    // Suffix order may differ between parallel runs; the placed sets may not
    auto names = [](const std::map<std::string, std::string> &tree)
    {
        std::set<std::string> out;
        for (const auto &entry : tree)
            out.insert(entry.first);
        return out;
    };
    auto contents = [](const std::map<std::string, std::string> &tree)
    {
        std::multiset<std::string> out;
        for (const auto &entry : tree)
            out.insert(entry.second);
        return out;
    };
    auto tree_one = snapshot(root_ / "out1");
    auto tree_two = snapshot(root_ / "out2");
    EXPECT_EQ(names(tree_one), names(tree_two));
    EXPECT_EQ(contents(tree_one), contents(tree_two));
    EXPECT_EQ(tree_one.size(), 7u);
    EXPECT_EQ(one.summary.renamed, 5u);
    EXPECT_EQ(two.summary.renamed, 5u);
    EXPECT_EQ(one.summary.skipped_duplicate, two.summary.skipped_duplicate);
}

TEST_F(WorkCoordinatorTest, FilesWithoutMetadataUseModificationTime)
{
    auto path = writeFile("incoming/scan.jpg", "\xFF\xD8\xFF nothing useful");
    setModificationTime(path, localTimestamp(2014, 7, 9));

    RunOutput output = runWith(config(TransferMode::COPY, destination_));

    ASSERT_EQ(output.results.size(), 1u);
    const auto &result = output.results.front();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::METADATA_UNREADABLE);
    EXPECT_EQ(result.decision.relative_path, "2014/07/scan.jpg");
    EXPECT_TRUE(result.resolved_date.isLowConfidence());
    EXPECT_EQ(output.summary.low_confidence, 1u);
}

TEST_F(WorkCoordinatorTest, ManyWorkersNeverCollide)
{
    for (int i = 0; i < 24; ++i)
    {
        writeFile("incoming/card" + std::to_string(i) + "/DSC_0001.JPG",
                  "\xFF\xD8\xFF DateTimeOriginal=2020:02:02 02:02:02 #" + std::to_string(1000 + i));
    }
    OrganizerConfig cfg = config(TransferMode::MOVE, destination_);
    cfg.concurrency = 6;

    RunOutput output = runWith(cfg);

    ASSERT_TRUE(output.error.empty()) << output.error;
    EXPECT_EQ(output.summary.moved, 24u);
    EXPECT_EQ(output.summary.renamed, 23u);
    EXPECT_EQ(output.summary.failed, 0u);

    auto tree = snapshot(destination_);
    EXPECT_EQ(tree.size(), 24u);
    std::set<std::string> contents;
    for (const auto &entry : tree)
        contents.insert(entry.second);
    EXPECT_EQ(contents.size(), 24u);
}

TEST_F(WorkCoordinatorTest, CancelStopsDispatch)
{
    for (int i = 0; i < 5; ++i)
    {
        writeFile("incoming/IMG_000" + std::to_string(i) + ".JPG", "\xFF\xD8\xFF DateTimeOriginal=2023:03:14 09:41:00 " + std::to_string(i));
    }

    WorkCoordinator coordinator(config(TransferMode::COPY, destination_), testRegistry());
    std::vector<ProcessingResult> results;
    bool completed = false;
    coordinator.run().subscribe(
        [&](const ProcessingResult &result)
        {
            results.push_back(result);
            coordinator.cancel();
        },
        [&completed]()
        { completed = true; });

    EXPECT_EQ(results.size(), 1u);
    EXPECT_TRUE(completed);
    EXPECT_TRUE(coordinator.getSummary().cancelled);
    EXPECT_EQ(coordinator.getProcessedCount(), 1u);
    EXPECT_EQ(coordinator.getTotalCount(), 5u);
}

TEST_F(WorkCoordinatorTest, StreamCannotBeReplayed)
{
    writeScenario();
    WorkCoordinator coordinator(config(TransferMode::COPY, destination_), testRegistry());
    RunOutput first = runWith(coordinator);
    EXPECT_TRUE(first.completed);

    RunOutput second = runWith(coordinator);
    EXPECT_FALSE(second.error.empty());
    EXPECT_TRUE(second.results.empty());
    EXPECT_FALSE(second.completed);
}

TEST_F(WorkCoordinatorTest, InvalidSourceAbortsTheRun)
{
    OrganizerConfig cfg = config(TransferMode::COPY, destination_);
    cfg.source_dir = (root_ / "does-not-exist").string();

    RunOutput output = runWith(cfg);
    EXPECT_FALSE(output.error.empty());
    EXPECT_FALSE(output.completed);
    EXPECT_TRUE(output.summary.aborted);
}

TEST_F(WorkCoordinatorTest, UncreatableDestinationAbortsTheRun)
{
    writeScenario();
    writeFile("blocker", "not a directory");

    RunOutput output = runWith(config(TransferMode::COPY, root_ / "blocker/library"));
    EXPECT_FALSE(output.error.empty());
    EXPECT_TRUE(output.summary.aborted);
    EXPECT_TRUE(output.results.empty());
}

TEST_F(WorkCoordinatorTest, NestedDestinationIsNotRescanned)
{
    writeScenario();
    fs::path nested = source_ / "Organized";
    writeFile("incoming/Organized/2020/01/old.jpg", "already sorted");

    RunOutput output = runWith(config(TransferMode::COPY, nested));

    EXPECT_EQ(output.summary.total_files, 4u);
    EXPECT_EQ(find(output, "old.jpg"), nullptr);
}

TEST_F(WorkCoordinatorTest, JunkFilesAreRecognisedCaseInsensitively)
{
    WorkCoordinator coordinator(config(TransferMode::MOVE, destination_), testRegistry());
    EXPECT_TRUE(coordinator.isJunkFile("/x/THUMBS.DB"));
    EXPECT_TRUE(coordinator.isJunkFile("/x/.ds_store"));
    EXPECT_TRUE(coordinator.isJunkFile("/x/Desktop.ini"));
    EXPECT_FALSE(coordinator.isJunkFile("/x/desktop.jpg"));
}
