/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace common {

namespace {

const char* const kKnownKeys[] = {
    ConfigManager::DB_HOST,
    ConfigManager::DB_PORT,
    ConfigManager::DB_NAME,
    ConfigManager::DB_USER,
    ConfigManager::DB_PASSWORD,
    ConfigManager::DB_POOL_MIN,
    ConfigManager::DB_POOL_MAX,
    ConfigManager::DB_ACQUIRE_TIMEOUT,
    ConfigManager::STORE_BACKEND,
    ConfigManager::BLOB_STORAGE_PATH,
    ConfigManager::HASH_CHUNK_SIZE,
    ConfigManager::SUBMIT_MAX_ATTEMPTS,
    ConfigManager::DEBUG,
    ConfigManager::LOG_LEVEL,
    ConfigManager::LOG_FILE,
};

// conninfo values: single quotes around, backslash-escape ' and backslash
std::string quoteConnInfoValue(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += "'";
    return out;
}

} // namespace

// Static members
std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
    spdlog::debug("ConfigManager initialized");
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        return std::stoi(value);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = value;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.find(key) != config_.end() || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, key == DB_PASSWORD ? "******" : value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    size_t loaded = 0;
    for (const char* key : kKnownKeys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            ++loaded;
        }
    }
    spdlog::debug("Configuration loaded from environment ({} keys)", loaded);
}

std::string ConfigManager::buildConnectionString() const {
    std::ostringstream ss;
    ss << "host=" << quoteConnInfoValue(getString(DB_HOST, "localhost"))
       << " port=" << getInt(DB_PORT, 5432)
       << " dbname=" << quoteConnInfoValue(getString(DB_NAME, "filehub"))
       << " user=" << quoteConnInfoValue(getString(DB_USER, "filehub"));

    std::string password = getString(DB_PASSWORD);
    if (!password.empty()) {
        ss << " password=" << quoteConnInfoValue(password);
    }
    ss << " connect_timeout=" << getInt(DB_ACQUIRE_TIMEOUT, 5);
    return ss.str();
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace common
