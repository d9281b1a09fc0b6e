#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

ConfigManager::ConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool ConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Cannot open configuration file: " + path);
        return false;
    }

    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration file " + path + ": " + e.displayText());
        return false;
    }
    Logger::info("Loaded configuration from " + path);
    return true;
}

bool ConfigManager::loadFromString(const std::string &json_text)
{
    std::istringstream in(json_text);
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration: " + e.displayText());
        return false;
    }
    return true;
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    std::string text = ss.str();
    if (text.empty())
    {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(text);
}

std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getString(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Config key " + key + " is not a string, using default: " + e.displayText());
        return def;
    }
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Config key " + key + " is not an integer, using default: " + e.displayText());
        return def;
    }
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Config key " + key + " is not a boolean, using default: " + e.displayText());
        return def;
    }
}

std::vector<std::string> ConfigManager::getStringList(const std::string &key, const std::vector<std::string> &def) const
{
    // Arrays are read through the JSON view; Poco only exposes scalar leaves
    nlohmann::json node = getAll();
    std::stringstream path(key);
    std::string part;
    while (std::getline(path, part, '.'))
    {
        if (!node.is_object() || !node.contains(part))
        {
            return def;
        }
        node = node[part];
    }

    if (!node.is_array())
    {
        Logger::warn("Config key " + key + " is not an array, using default");
        return def;
    }

    std::vector<std::string> values;
    for (const auto &item : node)
    {
        if (item.is_string())
        {
            values.push_back(item.get<std::string>());
        }
        else
        {
            Logger::warn("Ignoring non-string entry in " + key);
        }
    }
    return values;
}

int ConfigManager::getTimeout(const std::string &key, int def) const
{
    int timeout_ms = getInt(key, def);
    if (timeout_ms < MIN_TIMEOUT_MS || timeout_ms > MAX_TIMEOUT_MS)
    {
        Logger::warn(key + " " + std::to_string(timeout_ms) + " out of range [" + std::to_string(MIN_TIMEOUT_MS) +
                     ", " + std::to_string(MAX_TIMEOUT_MS) + "], using " + std::to_string(def));
        return def;
    }
    return timeout_ms;
}

OrganizerConfig ConfigManager::toOrganizerConfig() const
{
    OrganizerConfig config;

    config.source_dir = getString("source_dir", config.source_dir);
    config.destination_dir = getString("destination_dir", config.destination_dir);

    std::string mode = getString("transfer_mode", "move");
    if (mode == "copy")
    {
        config.transfer_mode = TransferMode::COPY;
    }
    else if (mode != "move")
    {
        Logger::warn("Unknown transfer_mode '" + mode + "', using move");
    }

    config.dry_run = getBool("dry_run", config.dry_run);

    config.log_level = getString("log_level", config.log_level);
    if (!Logger::isValidLevel(config.log_level))
    {
        Logger::warn("Invalid log_level '" + config.log_level + "', using INFO");
        config.log_level = "INFO";
    }
    config.log_file = getString("logging.file", config.log_file);

    int concurrency = getInt("threading.concurrency", config.concurrency);
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY)
    {
        Logger::warn("threading.concurrency " + std::to_string(concurrency) + " out of range [" +
                     std::to_string(MIN_CONCURRENCY) + ", " + std::to_string(MAX_CONCURRENCY) + "], using " +
                     std::to_string(config.concurrency));
    }
    else
    {
        config.concurrency = concurrency;
    }

    config.date_policy.earliest_year = getInt("date_policy.earliest_year", config.date_policy.earliest_year);
    config.date_policy.future_grace_days = getInt("date_policy.future_grace_days", config.date_policy.future_grace_days);
    if (config.date_policy.future_grace_days < 0)
    {
        Logger::warn("date_policy.future_grace_days cannot be negative, using 0");
        config.date_policy.future_grace_days = 0;
    }

    auto &extraction = config.extraction;
    extraction.filename_patterns = getStringList("extraction.filename_patterns", extraction.filename_patterns);
    extraction.disabled_strategies = getStringList("extraction.disabled_strategies", extraction.disabled_strategies);
    extraction.ffprobe_path = getString("extraction.ffprobe_path", extraction.ffprobe_path);
    extraction.ffprobe_timeout_ms = getTimeout("extraction.ffprobe_timeout_ms", extraction.ffprobe_timeout_ms);
    extraction.container_timeout_ms = getTimeout("extraction.container_timeout_ms", extraction.container_timeout_ms);
    int scan_bytes = getInt("extraction.xmp_scan_bytes", static_cast<int>(extraction.xmp_scan_bytes));
    if (scan_bytes > 0)
    {
        extraction.xmp_scan_bytes = static_cast<size_t>(scan_bytes);
    }

    auto &cleanup = config.cleanup;
    cleanup.delete_junk_files = getBool("cleanup.delete_junk_files", cleanup.delete_junk_files);
    cleanup.junk_file_names = getStringList("cleanup.junk_file_names", cleanup.junk_file_names);
    cleanup.remove_empty_dirs = getBool("cleanup.remove_empty_dirs", cleanup.remove_empty_dirs);

    return config;
}
