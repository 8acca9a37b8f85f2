#pragma once

#include <cstddef>

// ── Shell channels ──────────────────────────────────────────
// Leading space keeps the commands out of the remote shell history.
constexpr const char* SHELL_COMMAND          = " stty -echo; bash";
constexpr const char* SUDO_SHELL_COMMAND     = " stty -echo; sudo -i -u {}";
constexpr const char* SUDO_EXEC_COMMAND      = "echo '{}' | base64 -d | sudo -i -u {} bash";
constexpr const char* DEFAULT_SUDO_USER      = "root";

// ── Prompt detection ────────────────────────────────────────
constexpr const char* LINE_SEPARATOR         = "\r\n";
constexpr const char* SUDO_PASSWORD_PREFIX   = "[sudo] password for";
constexpr const char* SHELL_PROMPT_SUFFIX    = "$ ";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // Default TCP connect + handshake timeout
constexpr int SSH_KEEPALIVE_SECS         = 30;    // SSH keepalive interval
constexpr int SSH_POLL_INTERVAL_MS       = 10;    // Wait between non-blocking rounds
constexpr int SSH_WRITE_MAX_RETRIES      = 1000;  // EAGAIN retries before a write is stalled

// ── Transfers ───────────────────────────────────────────────
constexpr size_t DEFAULT_MAX_AT_ONCE     = 5;     // Files in flight per batch window
constexpr size_t DEFAULT_CHUNK_SIZE      = 32768;
constexpr int DEFAULT_FILE_MODE          = 0644;
constexpr int DEFAULT_DIR_MODE           = 0755;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
