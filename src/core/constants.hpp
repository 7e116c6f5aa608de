#pragma once

#include <cstdint>

// ── Versioning ──────────────────────────────────────────────
constexpr const char* STAGEHAND_VERSION = "0.4.0";

// ── Publish defaults ────────────────────────────────────────
constexpr int DEFAULT_BATCH_SIZE          = 20;    // Files per bulk upload call
constexpr int DEFAULT_MAX_ATTEMPTS        = 3;     // Attempts per batch before the publish fails
constexpr const char* DEFAULT_APP_DATA_DIR = "App_Data";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS    = 30;    // TCP connect + handshake
constexpr int SSH_DEFAULT_PORT            = 22;
constexpr int PROCESS_POLL_INTERVAL_MS    = 50;    // Supervisor completion/cancellation poll
constexpr int PROCESS_REAP_TIMEOUT_MS     = 2000;  // Max wait for a killed child to be reaped
constexpr int OUTPUT_READ_POLL_MS         = 50;    // Reader thread poll on a child's pipe

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SFTP_TRANSFER_BUF_SIZE      = 32768;
constexpr int SFTP_PATH_BUF_SIZE          = 1024;
constexpr int PROCESS_READ_BUF_SIZE       = 4096;
