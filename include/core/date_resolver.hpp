#pragma once

#include <string>
#include "core/date_validator.hpp"
#include "core/extractor_registry.hpp"
#include "core/media_file.hpp"

/**
 * @brief Walks a kind's strategies in order and returns the first acceptable date
 *
 * Every candidate goes through the same DateValidator. When all strategies are
 * exhausted the file's modification time is used; that fallback is always
 * accepted and marked with tier FILESYSTEM. A file is unresolved only if even
 * the modification time cannot be converted to a calendar date.
 *
 * Must not be called for UNSUPPORTED files; those go straight to Unknown/.
 */
class DateResolver
{
public:
    DateResolver(const ExtractorRegistry &registry, const DatePolicy &policy);

    ResolvedDate resolve(const MediaFile &file) const;

    static constexpr const char *FILESYSTEM_STRATEGY = "filesystem";

private:
    const ExtractorRegistry &registry_;
    DateValidator validator_;
};
