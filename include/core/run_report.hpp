#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/organizer_config.hpp"
#include "core/processing_result.hpp"

/**
 * @brief JSON rendering of per-file results and the run summary
 */
class RunReport
{
public:
    static nlohmann::json resultToJson(const ProcessingResult &result);
    static nlohmann::json summaryToJson(const RunSummary &summary);
    static nlohmann::json configToJson(const OrganizerConfig &config);

    static nlohmann::json build(const OrganizerConfig &config,
                                const std::vector<ProcessingResult> &results,
                                const RunSummary &summary);

    /**
     * @brief Write the report to a file
     * @return false if the file cannot be written
     */
    static bool write(const std::string &path, const nlohmann::json &report);
};
