#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadConfigFromString(const std::string& content);

    // Overrides a single value, creating intermediate objects as needed.
    // Returns false for an empty path.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Drops everything loaded so far; getters fall back to defaults.
    void reset();

    // Service
    std::string getServiceType() const;
    std::string getDisplayName() const;
    bool isAutoStart() const;

    // Session
    int getInviteTimeoutSec() const;
    int getReconnectInviteTimeoutSec() const;

    // Reconnect
    int getBackupInviteDelayMs() const;
    int getMaxReconnectAttempts() const;

    // Lifecycle
    int getRestartDebounceMs() const;
    bool isDisconnectInBackground() const;

    // Log journal
    int getLogJournalMaxEntries() const;

    // Logging
    std::string getLogLevel() const;
    bool isConsoleOutput() const;
    bool isAsyncLogging() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(const char* section, const char* key, T fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
