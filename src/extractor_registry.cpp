#include "core/extractor_registry.hpp"
#include "core/extractors/exif_strategy.hpp"
#include "core/extractors/ffmpeg_container_strategy.hpp"
#include "core/extractors/ffprobe_strategy.hpp"
#include "core/extractors/filename_date_strategy.hpp"
#include "core/extractors/libraw_strategy.hpp"
#include "core/extractors/png_text_strategy.hpp"
#include "core/extractors/xmp_strategy.hpp"
#include "logging/logger.hpp"
#include <set>

void ExtractorRegistry::registerStrategy(MediaKind kind, StrategyPtr strategy)
{
    if (!strategy || kind == MediaKind::UNSUPPORTED)
    {
        return;
    }
    strategies_[kind].push_back(std::move(strategy));
}

const std::vector<ExtractorRegistry::StrategyPtr> &ExtractorRegistry::strategiesFor(MediaKind kind) const
{
    static const std::vector<StrategyPtr> empty;
    auto it = strategies_.find(kind);
    if (it == strategies_.end())
    {
        return empty;
    }
    return it->second;
}

ExtractorRegistry ExtractorRegistry::createDefault(const ExtractionConfig &extraction, const DatePolicy &policy)
{
    std::set<std::string> disabled(extraction.disabled_strategies.begin(), extraction.disabled_strategies.end());

    auto exif = std::make_shared<ExifStrategy>(policy);
    auto libraw = std::make_shared<LibRawStrategy>();
    auto png_text = std::make_shared<PngTextStrategy>(policy);
    auto xmp = std::make_shared<XmpStrategy>(extraction.xmp_scan_bytes, policy);
    auto filename = std::make_shared<FilenameDateStrategy>(extraction.filename_patterns, policy);

    std::vector<StrategyPtr> image_chain = {exif, xmp, filename};
    std::vector<StrategyPtr> png_chain = {exif, png_text, xmp, filename};
    std::vector<StrategyPtr> gif_chain = {xmp, filename};
    std::vector<StrategyPtr> bmp_chain = {filename};
    std::vector<StrategyPtr> raw_chain = {exif, libraw, xmp, filename};

    std::vector<StrategyPtr> video_chain;
    if (disabled.count("ffprobe") == 0)
    {
        video_chain.push_back(std::make_shared<FfprobeStrategy>(extraction.ffprobe_path, extraction.ffprobe_timeout_ms, policy));
    }
    video_chain.push_back(std::make_shared<FfmpegContainerStrategy>(extraction.container_timeout_ms, policy));
    video_chain.push_back(xmp);
    video_chain.push_back(filename);

    std::map<MediaKind, std::vector<StrategyPtr>> chains = {
        {MediaKind::JPEG, image_chain},
        {MediaKind::TIFF, image_chain},
        {MediaKind::WEBP, image_chain},
        {MediaKind::HEIF, image_chain},
        {MediaKind::AVIF, image_chain},
        {MediaKind::JPEG2000, image_chain},
        {MediaKind::PNG, png_chain},
        {MediaKind::GIF, gif_chain},
        {MediaKind::BMP, bmp_chain},
        {MediaKind::RAW, raw_chain},
        {MediaKind::MP4, video_chain},
        {MediaKind::QUICKTIME, video_chain},
        {MediaKind::THREE_GP, video_chain},
        {MediaKind::AVI, video_chain},
        {MediaKind::MATROSKA, video_chain}};

    ExtractorRegistry registry;
    for (const auto &[kind, chain] : chains)
    {
        for (const auto &strategy : chain)
        {
            if (disabled.count(strategy->getName()) > 0)
                continue;
            registry.registerStrategy(kind, strategy);
        }
    }

    for (const auto &name : disabled)
    {
        Logger::info("Extraction strategy disabled by configuration: " + name);
    }
    return registry;
}
