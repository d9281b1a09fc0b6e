#pragma once

#include <map>
#include <memory>
#include <vector>
#include "core/extraction_strategy.hpp"
#include "core/media_kind.hpp"
#include "core/organizer_config.hpp"

/**
 * @brief Static mapping from media kind to its ordered extraction strategies
 *
 * Order encodes trust: the first strategy listed for a kind is consulted
 * first. Strategy instances are shared between kinds and between workers,
 * so they must be safe to call concurrently.
 */
class ExtractorRegistry
{
public:
    using StrategyPtr = std::shared_ptr<const ExtractionStrategy>;

    ExtractorRegistry() = default;

    /**
     * @brief Append a strategy to the end of a kind's list
     */
    void registerStrategy(MediaKind kind, StrategyPtr strategy);

    /**
     * @brief Ordered strategies for a kind; empty for UNSUPPORTED or unregistered kinds
     */
    const std::vector<StrategyPtr> &strategiesFor(MediaKind kind) const;

    /**
     * @brief Build the production registry from extraction settings
     * @param extraction Filename patterns, timeouts, and disabled strategy ids
     * @param policy Date policy used by strategies that scan for several candidates
     */
    static ExtractorRegistry createDefault(const ExtractionConfig &extraction, const DatePolicy &policy);

private:
    std::map<MediaKind, std::vector<StrategyPtr>> strategies_;
};
