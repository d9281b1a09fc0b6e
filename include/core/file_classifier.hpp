#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/media_kind.hpp"

/**
 * @brief Maps a file to a media kind from its extension and, when needed, its first bytes
 *
 * The extension decides unless it is missing or shared by several container
 * formats; then the byte prefix is matched against known signatures. An
 * unrecognised prefix keeps the extension's kind. A present but unknown
 * extension is UNSUPPORTED without sniffing.
 */
class FileClassifier
{
public:
    // Largest prefix the classifier ever looks at
    static constexpr size_t SNIFF_BYTES = 64;

    /**
     * @brief Classify a file
     * @param file_path Path (only the name is inspected)
     * @param prefix First bytes of the file, at most SNIFF_BYTES are used
     * @return Media kind, or MediaKind::UNSUPPORTED
     */
    static MediaKind classify(const std::string &file_path, const std::vector<uint8_t> &prefix);

    /**
     * @brief Identify a format purely from its leading bytes
     */
    static std::optional<MediaKind> sniff(const std::vector<uint8_t> &prefix);

    static bool isAmbiguousExtension(const std::string &extension);

    static std::vector<std::string> getSupportedExtensions();

private:
    static const std::map<std::string, MediaKind> extension_kinds_;
    static const std::set<std::string> ambiguous_extensions_;

    static std::optional<MediaKind> sniffIsoBmffBrand(const std::vector<uint8_t> &prefix);
};
