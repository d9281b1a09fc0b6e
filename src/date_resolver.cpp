#include "core/date_resolver.hpp"
#include "logging/logger.hpp"

DateResolver::DateResolver(const ExtractorRegistry &registry, const DatePolicy &policy)
    : registry_(registry), validator_(policy)
{
}

ResolvedDate DateResolver::resolve(const MediaFile &file) const
{
    for (const auto &strategy : registry_.strategiesFor(file.kind))
    {
        ExtractionOutcome outcome;
        try
        {
            outcome = strategy->tryExtract(file);
        }
        catch (const std::exception &e)
        {
            // A strategy that throws is treated like one that failed
            outcome = ExtractionOutcome::failed(std::string("uncaught exception: ") + e.what());
        }

        switch (outcome.status)
        {
        case ExtractionOutcome::Status::FOUND:
            if (validator_.isAcceptable(outcome.candidate.date))
            {
                Logger::debug("Date for " + file.path + " accepted from " + strategy->getName() +
                              ": " + outcome.candidate.date.toString());
                return ResolvedDate::fromCandidate(outcome.candidate);
            }
            Logger::debug("Strategy " + strategy->getName() + " produced implausible date " +
                          outcome.candidate.date.toString() + " for " + file.path);
            break;
        case ExtractionOutcome::Status::FAILED:
            Logger::debug("Strategy " + strategy->getName() + " failed for " + file.path + ": " + outcome.reason);
            break;
        case ExtractionOutcome::Status::NO_DATE:
            Logger::trace("Strategy " + strategy->getName() + " found no date in " + file.path);
            break;
        }
    }

    auto fallback = DateValidator::fromTimestamp(file.modification_time);
    if (!fallback)
    {
        Logger::warn("No usable date for " + file.path + ", modification time is out of range");
        return ResolvedDate::unresolved();
    }

    Logger::warn("Falling back to modification time for " + file.path + ": " + fallback->toString());
    DateCandidate candidate;
    candidate.date = *fallback;
    candidate.strategy = FILESYSTEM_STRATEGY;
    candidate.tier = ConfidenceTier::FILESYSTEM;
    return ResolvedDate::fromCandidate(candidate);
}
