#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>

// Service
constexpr const char* DEFAULT_SERVICE_TYPE = "nearmesh-bench";
constexpr const char* PEER_ID_PREFIX = "nearmesh-";
constexpr int PEER_ID_RANDOM_BYTES = 16;

// Invitations (seconds)
constexpr int INVITE_TIMEOUT_SEC = 10;
constexpr int RECONNECT_INVITE_TIMEOUT_SEC = 5;

// Timers (milliseconds)
constexpr int BACKUP_INVITE_DELAY_MS = 3000;
constexpr int RESTART_DEBOUNCE_MS = 500;

// Executor poll ceiling when no timer is due
constexpr int EVENT_LOOP_MAX_WAIT_MS = 1000;

// Log journal
constexpr int LOG_JOURNAL_MAX_ENTRIES = 500;

// Application payloads
constexpr const char* ACK_MARKER = "ACK";
constexpr uint8_t TEST_PAYLOAD[] = {1, 2, 3, 4, 5};

#endif // CONSTANTS_H
