#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "core/date_validator.hpp"
#include "core/extraction_strategy.hpp"

/**
 * @brief Creation time from PNG tEXt/iTXt chunks
 *
 * Walks the chunk list without reading image data. Compressed text is ignored.
 */
class PngTextStrategy : public ExtractionStrategy
{
public:
    explicit PngTextStrategy(const DatePolicy &policy);

    std::string getName() const override { return "png_text"; }
    ConfidenceTier getTier() const override { return ConfidenceTier::CONTAINER; }
    ExtractionOutcome tryExtract(const MediaFile &file) const override;

    /**
     * @brief Collect keyword/text pairs from uncompressed text chunks
     * @return Keywords lower-cased; nullopt when the file is not a readable PNG
     */
    static std::optional<std::map<std::string, std::string>> readTextChunks(const std::string &file_path);

private:
    DateValidator validator_;

    static const std::vector<std::string> date_keywords_;
    static constexpr uint32_t MAX_TEXT_CHUNK = 64 * 1024;
    static constexpr int MAX_CHUNKS = 4096;

    std::optional<CaptureDate> parseCreationTime(const std::string &value) const;
};
