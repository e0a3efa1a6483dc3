#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_ERROR("Config: failed to open config file: " + config_path);
        return false;
    }
    try {
        json parsed = json::parse(config_file);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level of " + config_path + " is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
    } catch (const json::exception& e) {
        LOG_ERROR("Config: loading " + config_path + " failed: " + e.what());
        return false;
    }
    LOG_INFO("Config: loaded from " + config_path);
    return true;
}

bool ConfigManager::loadConfigFromString(const std::string& content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Config: parse failed: ") + e.what());
        return false;
    }
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

template <typename T>
T ConfigManager::valueAt(const char* section, const char* key, T fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sit = m_config.find(section);
    if (sit == m_config.end() || !sit->is_object()) {
        return fallback;
    }
    auto kit = sit->find(key);
    if (kit == sit->end() || kit->is_null()) {
        return fallback;
    }
    try {
        return kit->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN(std::string("Config: bad value for ") + section + "." + key + ": " + e.what());
        return fallback;
    }
}

std::string ConfigManager::getServiceType() const {
    return valueAt<std::string>("service", "type", DEFAULT_SERVICE_TYPE);
}

std::string ConfigManager::getDisplayName() const {
    return valueAt<std::string>("service", "display_name", "");
}

bool ConfigManager::isAutoStart() const {
    return valueAt<bool>("service", "auto_start", true);
}

int ConfigManager::getInviteTimeoutSec() const {
    return valueAt<int>("session", "invite_timeout_sec", INVITE_TIMEOUT_SEC);
}

int ConfigManager::getReconnectInviteTimeoutSec() const {
    return valueAt<int>("session", "reconnect_invite_timeout_sec", RECONNECT_INVITE_TIMEOUT_SEC);
}

int ConfigManager::getBackupInviteDelayMs() const {
    return valueAt<int>("reconnect", "backup_invite_delay_ms", BACKUP_INVITE_DELAY_MS);
}

int ConfigManager::getMaxReconnectAttempts() const {
    return valueAt<int>("reconnect", "max_attempts", 0);
}

int ConfigManager::getRestartDebounceMs() const {
    return valueAt<int>("lifecycle", "restart_debounce_ms", RESTART_DEBOUNCE_MS);
}

bool ConfigManager::isDisconnectInBackground() const {
    return valueAt<bool>("lifecycle", "disconnect_in_background", false);
}

int ConfigManager::getLogJournalMaxEntries() const {
    return valueAt<int>("log_journal", "max_entries", LOG_JOURNAL_MAX_ENTRIES);
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}

bool ConfigManager::isConsoleOutput() const {
    return valueAt<bool>("logging", "console_output", true);
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>("logging", "async", false);
}
