#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/pipeline_config.hpp"

/**
 * @brief Process-wide configuration backed by a Poco JSONConfiguration
 *
 * Defaults are seeded in code; load() replaces them with a config.json and
 * missing keys fall back to the same defaults through the typed getters.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    /**
     * @brief Drop everything loaded and reseed the built-in defaults
     */
    void resetToDefaults();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;

    std::string getLogLevel() const;
    std::string getLogFile() const;

    // Section getters
    EncoderConfig getEncoderConfig() const;
    TransformBounds getTransformBounds() const;
    UniqueizationConfig getUniqueizationConfig() const;
    PublishConfig getPublishConfig() const;
    ProviderConfig getProviderConfig() const;
    StorageConfig getStorageConfig() const;
    ScheduleConfig getScheduleConfig() const;

    /**
     * @brief Check ranges, limits and ordering of every section
     * @return true when the configuration can drive a batch; failures are logged
     */
    bool validateConfig() const;

    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();
    RangeBound getRange(const std::string &knob, const RangeBound &def) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
