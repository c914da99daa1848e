#pragma once

/**
 * @file app_config.h
 * @brief Application configuration loaded from environment variables
 *
 * Read through common::ConfigManager so runtime overrides (set()) apply.
 */

#include <string>
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "config_manager.h"
#include "exceptions.h"

struct AppConfig {
    std::string dbHost = "postgres";
    int dbPort = 5432;
    std::string dbName = "certmgr";
    std::string dbUser = "certmgr";
    std::string dbPassword;  // Must be set via environment variable
    int dbPoolMin = 1;
    int dbPoolMax = 5;

    std::string logLevel = "info";
    std::string logFile;

    // Certificate material
    std::string certRootPath = "/etc/certificates";
    std::string certCaRootPath = "/etc/certificates/CA";
    std::string defaultCertName = "certmgr_default";

    // ACME
    int acmeFinalizeTimeoutSec = 600;
    int acmePollIntervalSec = 3;
    int acmeHttpTimeoutSec = 30;

    // Renewal scheduler
    bool renewalEnabled = true;
    int renewalIntervalHours = 24;
    int renewalStartupDelaySec = 10;

    // Safe integer parser with range clamping
    static int envStoi(const std::string& val, int defaultVal, int minVal, int maxVal) {
        try {
            int v = std::stoi(val);
            return std::clamp(v, minVal, maxVal);
        } catch (const std::exception&) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
            return defaultVal;
        }
    }

    static AppConfig fromEnvironment() {
        using common::ConfigManager;
        auto& cfg = ConfigManager::getInstance();
        AppConfig config;

        auto str = [&cfg](const char* key, std::string& target) {
            std::string v = cfg.getString(key);
            if (!v.empty()) target = v;
        };
        auto num = [&cfg](const char* key, int& target, int minVal, int maxVal) {
            std::string v = cfg.getString(key);
            if (!v.empty()) target = envStoi(v, target, minVal, maxVal);
        };

        str(ConfigManager::DB_HOST, config.dbHost);
        num(ConfigManager::DB_PORT, config.dbPort, 1, 65535);
        str(ConfigManager::DB_NAME, config.dbName);
        str(ConfigManager::DB_USER, config.dbUser);
        str(ConfigManager::DB_PASSWORD, config.dbPassword);
        num(ConfigManager::DB_POOL_MIN, config.dbPoolMin, 1, 32);
        num(ConfigManager::DB_POOL_MAX, config.dbPoolMax, 1, 64);
        if (config.dbPoolMax < config.dbPoolMin) config.dbPoolMax = config.dbPoolMin;

        str(ConfigManager::LOG_LEVEL, config.logLevel);
        str(ConfigManager::LOG_FILE, config.logFile);

        str(ConfigManager::CERT_ROOT_PATH, config.certRootPath);
        str(ConfigManager::CERT_CA_ROOT_PATH, config.certCaRootPath);
        str(ConfigManager::DEFAULT_CERT_NAME, config.defaultCertName);

        num(ConfigManager::ACME_FINALIZE_TIMEOUT_SEC, config.acmeFinalizeTimeoutSec, 10, 3600);
        num(ConfigManager::ACME_POLL_INTERVAL_SEC, config.acmePollIntervalSec, 1, 60);
        num(ConfigManager::ACME_HTTP_TIMEOUT_SEC, config.acmeHttpTimeoutSec, 1, 300);

        config.renewalEnabled = cfg.getBool(ConfigManager::RENEWAL_ENABLED, config.renewalEnabled);
        num(ConfigManager::RENEWAL_INTERVAL_HOURS, config.renewalIntervalHours, 1, 24 * 30);
        num(ConfigManager::RENEWAL_STARTUP_DELAY_SEC, config.renewalStartupDelaySec, 0, 3600);

        return config;
    }

    // Validate required credentials are set
    void validateRequiredCredentials() const {
        if (dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        spdlog::info("All required credentials loaded from environment");
    }
};
