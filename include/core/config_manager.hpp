#pragma once

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/organizer_config.hpp"

/**
 * @brief JSON configuration file access (dotted keys with defaults)
 *
 * Values missing from the file, or of the wrong type, fall back to the
 * OrganizerConfig defaults with a warning.
 */
class ConfigManager
{
public:
    ConfigManager();

    /**
     * @brief Load a JSON configuration file
     * @return false if the file is missing or not valid JSON (previous values are kept)
     */
    bool load(const std::string &path);

    bool loadFromString(const std::string &json_text);

    nlohmann::json getAll() const;

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    std::vector<std::string> getStringList(const std::string &key, const std::vector<std::string> &def) const;

    /**
     * @brief Build the immutable run configuration
     */
    OrganizerConfig toOrganizerConfig() const;

    static constexpr int MIN_CONCURRENCY = 1;
    static constexpr int MAX_CONCURRENCY = 64;
    static constexpr int MIN_TIMEOUT_MS = 100;
    static constexpr int MAX_TIMEOUT_MS = 600000;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    // Per-file probe limits in milliseconds, range checked
    int getTimeout(const std::string &key, int def) const;
};
