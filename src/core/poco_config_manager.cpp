#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *const LIBRARY_PREFERENCES_KEY = "library_preferences";

    // Arrays written through update() are stored as JSON text by Poco
    void readStringList(const nlohmann::json &section, const std::string &key, std::vector<std::string> &target)
    {
        auto it = section.find(key);
        if (it == section.end() || it->is_null())
            return;

        nlohmann::json value = *it;
        if (value.is_string())
            value = nlohmann::json::parse(value.get<std::string>(), nullptr, false);

        if (!value.is_array())
        {
            Logger::warn("Ignoring " + key + ": expected an array of strings");
            return;
        }

        std::vector<std::string> list;
        for (const auto &entry : value)
        {
            if (entry.is_string())
                list.push_back(entry.get<std::string>());
            else
                Logger::warn("Ignoring non-string entry in " + key + ": " + entry.dump());
        }
        target = list;
    }

    void readBool(const nlohmann::json &section, const std::string &key, bool &target)
    {
        auto it = section.find(key);
        if (it == section.end())
            return;
        if (it->is_boolean())
            target = it->get<bool>();
        else if (it->is_string())
            target = it->get<std::string>() == "true";
    }

    nlohmann::json librarySection(const nlohmann::json &all)
    {
        auto it = all.find(LIBRARY_PREFERENCES_KEY);
        if (it == all.end() || !it->is_object())
            return nlohmann::json::object();
        return *it;
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse config file " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config value " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config value " + key + " is not a boolean, using " + (def ? "true" : "false"));
        return def;
    }
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

bool PocoConfigManager::isEnabled() const
{
    return getBool("enable_plugin", true);
}

int PocoConfigManager::getScanThreads() const
{
    int threads = getInt("scan_threads", DEFAULT_SCAN_THREADS);
    int clamped = std::max(MIN_SCAN_THREADS, std::min(MAX_SCAN_THREADS, threads));
    if (clamped != threads)
        Logger::warn("scan_threads " + std::to_string(threads) + " out of range, using " + std::to_string(clamped));
    return clamped;
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getAuditRetentionDays() const
{
    return getInt("audit_retention_days", DEFAULT_AUDIT_RETENTION_DAYS);
}

bool PocoConfigManager::isDryRunMode() const
{
    return getBool("dry_run_mode", false);
}

GroupingMode PocoConfigManager::getGroupingMode() const
{
    return GroupingModes::fromString(getString("grouping_mode", "EDGE"));
}

std::string PocoConfigManager::getDatabasePath() const
{
    return getString("database_path", "media_dedup.db");
}

LibraryPreferences PocoConfigManager::getLibraryPreferences(const std::string &collection_id) const
{
    LibraryPreferences preferences;
    preferences.library_id = collection_id;

    nlohmann::json libraries = librarySection(getAll());
    auto it = libraries.find(collection_id);
    if (it == libraries.end() || !it->is_object())
    {
        Logger::debug("No preferences configured for collection " + collection_id + ", using defaults");
        return preferences;
    }

    const nlohmann::json &section = *it;
    readStringList(section, "resolution_priority", preferences.resolution_priority);
    readStringList(section, "dynamic_range_priority", preferences.dynamic_range_priority);
    readStringList(section, "codec_priority", preferences.codec_priority);
    readStringList(section, "audio_priority", preferences.audio_priority);
    readStringList(section, "source_type_priority", preferences.source_type_priority);

    auto threshold = section.find("similarity_threshold");
    if (threshold != section.end())
    {
        if (threshold->is_number())
            preferences.similarity_threshold = threshold->get<int>();
        else if (threshold->is_string())
        {
            try
            {
                preferences.similarity_threshold = std::stoi(threshold->get<std::string>());
            }
            catch (const std::exception &)
            {
                Logger::warn("Ignoring similarity_threshold of " + collection_id + ": not a number");
            }
        }
    }

    readBool(section, "auto_delete_enabled", preferences.auto_delete_enabled);
    readBool(section, "require_manual_review", preferences.require_manual_review);

    auto minimum = section.find("minimum_quality_threshold");
    if (minimum != section.end() && minimum->is_string())
        preferences.minimum_quality_threshold = minimum->get<std::string>();

    return preferences;
}

std::vector<std::string> PocoConfigManager::validate() const
{
    std::vector<std::string> problems;

    int threads = getInt("scan_threads", DEFAULT_SCAN_THREADS);
    if (threads < MIN_SCAN_THREADS || threads > MAX_SCAN_THREADS)
        problems.push_back("scan_threads must be between 1 and 8, got " + std::to_string(threads));

    int retention = getAuditRetentionDays();
    if (retention < 0)
        problems.push_back("audit_retention_days must not be negative, got " + std::to_string(retention));

    std::string mode = getString("grouping_mode", "EDGE");
    if (!GroupingModes::isValidName(mode))
        problems.push_back("Invalid grouping_mode: " + mode);

    std::string level = getLogLevel();
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });
    if (upper != "TRACE" && upper != "DEBUG" && upper != "INFO" && upper != "WARN" && upper != "WARNING" &&
        upper != "ERROR")
        problems.push_back("Invalid log_level: " + level);

    nlohmann::json libraries = librarySection(getAll());
    for (auto it = libraries.begin(); it != libraries.end(); ++it)
    {
        if (!it.value().is_object())
        {
            problems.push_back("library_preferences." + it.key() + " must be an object");
            continue;
        }
        int threshold = getLibraryPreferences(it.key()).similarity_threshold;
        if (threshold < 0 || threshold > MAX_SIMILARITY_THRESHOLD)
            problems.push_back("library_preferences." + it.key() + ".similarity_threshold must be between 0 and 140, got " +
                               std::to_string(threshold));
    }

    for (const auto &problem : problems)
        Logger::error("Config: " + problem);
    return problems;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setBool("enable_plugin", true);
    cfg_->setInt("scan_threads", DEFAULT_SCAN_THREADS);
    cfg_->setString("log_level", "INFO");
    cfg_->setInt("audit_retention_days", DEFAULT_AUDIT_RETENTION_DAYS);
    cfg_->setBool("dry_run_mode", false);
    cfg_->setString("grouping_mode", "EDGE");
    cfg_->setString("database_path", "media_dedup.db");
}
