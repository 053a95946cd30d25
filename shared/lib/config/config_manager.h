/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment-driven configuration.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Programmatic overrides (used by tests and the command line)
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value; unparseable values fall back to the default
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides the environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an override so the environment is consulted again
     */
    void unset(const std::string& key);

    /**
     * @brief Load all known keys from the environment
     */
    void loadFromEnvironment();

    /**
     * @brief Build a libpq connection string from the DB_* keys
     *
     * Values are single-quoted and escaped as libpq's conninfo syntax requires.
     */
    std::string buildConnectionString() const;

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Database
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_POOL_MIN = "DB_POOL_MIN";
    static constexpr const char* DB_POOL_MAX = "DB_POOL_MAX";
    static constexpr const char* DB_ACQUIRE_TIMEOUT = "DB_ACQUIRE_TIMEOUT";

    // Store
    static constexpr const char* STORE_BACKEND = "STORE_BACKEND";
    static constexpr const char* BLOB_STORAGE_PATH = "BLOB_STORAGE_PATH";
    static constexpr const char* HASH_CHUNK_SIZE = "HASH_CHUNK_SIZE";
    static constexpr const char* SUBMIT_MAX_ATTEMPTS = "SUBMIT_MAX_ATTEMPTS";

    // Service
    static constexpr const char* DEBUG = "DEBUG";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
