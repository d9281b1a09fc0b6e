#include "core/config_manager.hpp"
#include "core/run_report.hpp"
#include "core/shutdown_manager.hpp"
#include "core/work_coordinator.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    const int EXIT_OK = 0;
    const int EXIT_FAILURE_RUN = 1;
    const int EXIT_CANCELLED = 2;

    struct CommandLine
    {
        std::string config_path;
        std::optional<std::string> source;
        std::optional<std::string> destination;
        std::optional<TransferMode> transfer_mode;
        bool dry_run = false;
        std::optional<int> concurrency;
        std::optional<std::string> log_level;
        std::string report_path;
        bool help = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Media Organizer - sort photos and videos into YYYY/MM folders by capture date" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE        JSON configuration file" << std::endl;
        std::cout << "  --source DIR         Directory to organize" << std::endl;
        std::cout << "  --destination DIR    Root of the dated folder tree" << std::endl;
        std::cout << "  --move               Move files (default)" << std::endl;
        std::cout << "  --copy               Copy files, keep the source" << std::endl;
        std::cout << "  --dry-run            Plan and report only, change nothing" << std::endl;
        std::cout << "  --concurrency N      Worker count (1-64); with N > 1, which of several same-named" << std::endl;
        std::cout << "                       files receives _1, _2, ... may vary between runs." << std::endl;
        std::cout << "                       Use 1 for byte-identical naming across clean runs" << std::endl;
        std::cout << "  --log-level LEVEL    TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --report FILE        Write per-file results as JSON" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
    }

    // Returns nullopt on a usage error (already reported)
    std::optional<CommandLine> parseCommandLine(int argc, char *argv[])
    {
        CommandLine cmd;
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto nextValue = [&](std::string &out) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                out = argv[++i];
                return true;
            };

            std::string value;
            if (arg == "--help" || arg == "-h")
            {
                cmd.help = true;
            }
            else if (arg == "--config")
            {
                if (!nextValue(cmd.config_path))
                    return std::nullopt;
            }
            else if (arg == "--source")
            {
                if (!nextValue(value))
                    return std::nullopt;
                cmd.source = value;
            }
            else if (arg == "--destination")
            {
                if (!nextValue(value))
                    return std::nullopt;
                cmd.destination = value;
            }
            else if (arg == "--move" || arg == "--copy")
            {
                TransferMode mode = (arg == "--copy") ? TransferMode::COPY : TransferMode::MOVE;
                if (cmd.transfer_mode && *cmd.transfer_mode != mode)
                {
                    std::cerr << "Error: --move and --copy are mutually exclusive" << std::endl;
                    return std::nullopt;
                }
                cmd.transfer_mode = mode;
            }
            else if (arg == "--dry-run")
            {
                cmd.dry_run = true;
            }
            else if (arg == "--concurrency")
            {
                if (!nextValue(value))
                    return std::nullopt;
                try
                {
                    size_t consumed = 0;
                    int n = std::stoi(value, &consumed);
                    if (consumed != value.size() || n < ConfigManager::MIN_CONCURRENCY || n > ConfigManager::MAX_CONCURRENCY)
                    {
                        throw std::out_of_range(value);
                    }
                    cmd.concurrency = n;
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: --concurrency expects an integer between " << ConfigManager::MIN_CONCURRENCY
                              << " and " << ConfigManager::MAX_CONCURRENCY << std::endl;
                    return std::nullopt;
                }
            }
            else if (arg == "--log-level")
            {
                if (!nextValue(value))
                    return std::nullopt;
                if (!Logger::isValidLevel(value))
                {
                    std::cerr << "Error: unknown log level " << value << std::endl;
                    return std::nullopt;
                }
                cmd.log_level = value;
            }
            else if (arg == "--report")
            {
                if (!nextValue(cmd.report_path))
                    return std::nullopt;
            }
            else
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                return std::nullopt;
            }
        }
        return cmd;
    }

    void printSummary(const RunSummary &summary, bool dry_run)
    {
        std::cout << (dry_run ? "Dry run summary" : "Summary") << std::endl;
        std::cout << "  files found:       " << summary.total_files << std::endl;
        std::cout << "  processed:         " << summary.processed << std::endl;
        if (dry_run)
            std::cout << "  would transfer:    " << summary.planned << std::endl;
        std::cout << "  moved:             " << summary.moved << std::endl;
        std::cout << "  copied:            " << summary.copied << std::endl;
        std::cout << "  skipped duplicate: " << summary.skipped_duplicate << std::endl;
        std::cout << "  renamed:           " << summary.renamed << std::endl;
        std::cout << "  unresolved date:   " << summary.unresolved_date << std::endl;
        std::cout << "  low confidence:    " << summary.low_confidence << std::endl;
        std::cout << "  unsupported:       " << summary.unsupported << std::endl;
        std::cout << "  failed:            " << summary.failed << std::endl;
        if (summary.junk_deleted > 0 || summary.empty_dirs_removed > 0)
        {
            std::cout << "  junk deleted:      " << summary.junk_deleted << std::endl;
            std::cout << "  empty dirs removed: " << summary.empty_dirs_removed << std::endl;
        }
    }
}

int main(int argc, char *argv[])
{
    auto cmd = parseCommandLine(argc, argv);
    if (!cmd)
    {
        printUsage(argv[0]);
        return EXIT_FAILURE_RUN;
    }
    if (cmd->help)
    {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    Logger::init(cmd->log_level.value_or("INFO"));

    ConfigManager config_manager;
    if (!cmd->config_path.empty() && !config_manager.load(cmd->config_path))
    {
        return EXIT_FAILURE_RUN;
    }

    // Command line wins over the configuration file
    OrganizerConfig config = config_manager.toOrganizerConfig();
    if (cmd->source)
        config.source_dir = *cmd->source;
    if (cmd->destination)
        config.destination_dir = *cmd->destination;
    if (cmd->transfer_mode)
        config.transfer_mode = *cmd->transfer_mode;
    if (cmd->dry_run)
        config.dry_run = true;
    if (cmd->concurrency)
        config.concurrency = *cmd->concurrency;
    if (cmd->log_level)
        config.log_level = *cmd->log_level;

    Logger::init(config.log_level);
    if (!config.log_file.empty())
    {
        Logger::addFileSink(config.log_file);
    }

    if (config.source_dir.empty() || config.destination_dir.empty())
    {
        std::cerr << "Error: source and destination directories are required" << std::endl;
        printUsage(argv[0]);
        return EXIT_FAILURE_RUN;
    }

    WorkCoordinator coordinator(config);

    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.registerCallback([&coordinator]()
                                      { coordinator.cancel(); });
    shutdown_manager.installSignalHandlers();

    std::vector<ProcessingResult> results;
    std::optional<std::string> fatal_error;

    coordinator.run().subscribe(
        [&results](const ProcessingResult &result)
        {
            results.push_back(result);
        },
        [&fatal_error](const std::exception &e)
        {
            fatal_error = e.what();
        },
        []()
        {
            Logger::debug("Result stream complete");
        });

    shutdown_manager.reset();

    RunSummary summary = coordinator.getSummary();
    printSummary(summary, config.dry_run);

    bool report_failed = false;
    if (!cmd->report_path.empty())
    {
        report_failed = !RunReport::write(cmd->report_path, RunReport::build(config, results, summary));
    }

    if (fatal_error)
    {
        std::cerr << "Fatal: " << *fatal_error << std::endl;
        return EXIT_FAILURE_RUN;
    }
    if (summary.cancelled)
    {
        return EXIT_CANCELLED;
    }
    return report_failed ? EXIT_FAILURE_RUN : EXIT_OK;
}
