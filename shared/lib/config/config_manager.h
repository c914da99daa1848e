/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Unified access to environment variables and runtime overrides.
 * Thread-safe singleton; environment values are snapshotted on first use
 * and individual keys can be overridden with set().
 *
 * @date 2026-02-04
 */

#pragma once

#include <string>
#include <map>
#include <optional>
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
     * @brief Get integer configuration value
     *
     * Unparseable values fall back to @p defaultValue with a warning.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /// Drop a runtime override so the environment value applies again
    void unset(const std::string& key);

    /**
     * @brief Snapshot all known keys from the environment
     */
    void loadFromEnvironment();

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

    // Certificate material
    static constexpr const char* CERT_ROOT_PATH = "CERT_ROOT_PATH";
    static constexpr const char* CERT_CA_ROOT_PATH = "CERT_CA_ROOT_PATH";
    static constexpr const char* DEFAULT_CERT_NAME = "DEFAULT_CERT_NAME";

    // ACME
    static constexpr const char* ACME_FINALIZE_TIMEOUT_SEC = "ACME_FINALIZE_TIMEOUT_SEC";
    static constexpr const char* ACME_POLL_INTERVAL_SEC = "ACME_POLL_INTERVAL_SEC";
    static constexpr const char* ACME_HTTP_TIMEOUT_SEC = "ACME_HTTP_TIMEOUT_SEC";

    // Renewal scheduler
    static constexpr const char* RENEWAL_ENABLED = "RENEWAL_ENABLED";
    static constexpr const char* RENEWAL_INTERVAL_HOURS = "RENEWAL_INTERVAL_HOURS";
    static constexpr const char* RENEWAL_STARTUP_DELAY_SEC = "RENEWAL_STARTUP_DELAY_SEC";

    // Service
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
