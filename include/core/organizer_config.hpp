#pragma once

#include <string>
#include <vector>
#include "core/processing_result.hpp"

/**
 * @brief Plausibility bounds shared by every date source
 */
struct DatePolicy
{
    int earliest_year = 1990;    // Before consumer digital cameras
    int future_grace_days = 1;   // Timezone slack past "now"
};

/**
 * @brief Extraction tuning consumed by the default registry
 */
struct ExtractionConfig
{
    // Groups 1-3 capture year, month, day; optional groups 4-6 capture hour, minute, second
    std::vector<std::string> filename_patterns = {
        R"((?:^|[^0-9])((?:19|20)\d{2})(\d{2})(\d{2})[_-](\d{2})(\d{2})(\d{2})(?:[^0-9]|$))",
        R"((?:^|[^0-9])((?:19|20)\d{2})-(\d{2})-(\d{2})[ _.-](\d{2})[.:-](\d{2})[.:-](\d{2})(?:[^0-9]|$))",
        R"((?:^|[^0-9])((?:19|20)\d{2})(\d{2})(\d{2})(?:[^0-9]|$))",
        R"((?:^|[^0-9])((?:19|20)\d{2})[-_.](\d{2})[-_.](\d{2})(?:[^0-9]|$))"};
    std::vector<std::string> disabled_strategies;
    std::string ffprobe_path = "ffprobe";
    int ffprobe_timeout_ms = 10000;
    int container_timeout_ms = 10000;
    size_t xmp_scan_bytes = 3 * 1024 * 1024;
};

struct CleanupConfig
{
    bool delete_junk_files = true;
    std::vector<std::string> junk_file_names = {"thumbs.db", "desktop.ini", ".ds_store", "desktop"};
    bool remove_empty_dirs = true;
};

/**
 * @brief Run configuration, built once and passed by value into the coordinator
 */
struct OrganizerConfig
{
    std::string source_dir;
    std::string destination_dir;
    TransferMode transfer_mode = TransferMode::MOVE;
    bool dry_run = false;
    int concurrency = 4;
    std::string log_level = "INFO";
    std::string log_file;
    DatePolicy date_policy;
    ExtractionConfig extraction;
    CleanupConfig cleanup;
};
