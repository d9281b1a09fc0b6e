#include "core/run_report.hpp"
#include "logging/logger.hpp"
#include <fstream>

nlohmann::json RunReport::resultToJson(const ProcessingResult &result)
{
    nlohmann::json entry;
    entry["source"] = result.source_path;
    entry["success"] = result.success;
    entry["kind"] = MediaKinds::getKindName(result.kind);
    entry["processing_time_ms"] = result.processing_time_ms;

    if (result.error_kind != ErrorKind::NONE)
    {
        entry["error_kind"] = errorKindName(result.error_kind);
    }
    if (!result.error_message.empty())
    {
        entry["error_message"] = result.error_message;
    }

    if (result.resolved_date.resolved)
    {
        entry["date"] = result.resolved_date.date.toString();
        entry["date_strategy"] = result.resolved_date.strategy;
        entry["date_tier"] = tierName(result.resolved_date.tier);
    }
    else
    {
        entry["date"] = nullptr;
    }

    if (result.has_decision)
    {
        entry["destination"] = result.decision.relative_path;
        entry["action"] = placementActionName(result.decision.action);
        entry["applied"] = result.applied;
        if (!result.decision.collision_reason.empty())
        {
            entry["collision_reason"] = result.decision.collision_reason;
        }
    }
    return entry;
}

nlohmann::json RunReport::summaryToJson(const RunSummary &summary)
{
    nlohmann::json json;
    json["total_files"] = summary.total_files;
    json["processed"] = summary.processed;
    json["moved"] = summary.moved;
    json["copied"] = summary.copied;
    json["planned"] = summary.planned;
    json["skipped_duplicate"] = summary.skipped_duplicate;
    json["renamed"] = summary.renamed;
    json["unresolved_date"] = summary.unresolved_date;
    json["low_confidence"] = summary.low_confidence;
    json["unsupported"] = summary.unsupported;
    json["failed"] = summary.failed;
    json["junk_deleted"] = summary.junk_deleted;
    json["empty_dirs_removed"] = summary.empty_dirs_removed;
    json["cancelled"] = summary.cancelled;
    json["aborted"] = summary.aborted;
    if (summary.aborted)
    {
        json["abort_reason"] = summary.abort_reason;
    }
    return json;
}

nlohmann::json RunReport::configToJson(const OrganizerConfig &config)
{
    return {
        {"source_dir", config.source_dir},
        {"destination_dir", config.destination_dir},
        {"transfer_mode", config.transfer_mode == TransferMode::COPY ? "copy" : "move"},
        {"dry_run", config.dry_run},
        {"concurrency", config.concurrency},
        {"date_policy", {{"earliest_year", config.date_policy.earliest_year}, {"future_grace_days", config.date_policy.future_grace_days}}},
        {"disabled_strategies", config.extraction.disabled_strategies}};
}

nlohmann::json RunReport::build(const OrganizerConfig &config,
                                const std::vector<ProcessingResult> &results,
                                const RunSummary &summary)
{
    nlohmann::json report;
    report["config"] = configToJson(config);
    report["summary"] = summaryToJson(summary);
    report["files"] = nlohmann::json::array();
    for (const auto &result : results)
    {
        report["files"].push_back(resultToJson(result));
    }
    return report;
}

bool RunReport::write(const std::string &path, const nlohmann::json &report)
{
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot write report to " + path);
        return false;
    }
    out << report.dump(2) << std::endl;
    if (!out.good())
    {
        Logger::error("Error while writing report to " + path);
        return false;
    }
    Logger::info("Report written to " + path);
    return true;
}
