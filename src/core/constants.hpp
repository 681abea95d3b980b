#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_MS         = 10000;  // TCP connect + handshake + auth
constexpr int KEEPALIVE_INTERVAL_MS      = 30000;  // SSH keepalive cadence
constexpr int RECONNECT_INTERVAL_MS      = 3000;   // Delay between reconnect attempts
constexpr int WRITE_TIMEOUT_MS           = 60000;  // Ceiling for a confirmed remote write
constexpr int WATCH_PROBE_WAIT_MS        = 2000;   // watch_file waits this long for the probe
constexpr int HOST_VERIFY_TIMEOUT_MS     = 120000; // Host key prompt must be answered by then
constexpr int CHANNEL_OPEN_TIMEOUT_MS    = 30000;  // EAGAIN loop ceiling when opening a channel
constexpr int MONITOR_POLL_MS            = 250;    // Transport monitor socket poll

// ── Search ──────────────────────────────────────────────────
constexpr int SEARCH_MAX_RESULTS         = 500;
constexpr int SEARCH_MAX_STAT            = 100;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;
constexpr size_t DEFAULT_CHUNK_SIZE      = 64 * 1024;
constexpr int FORWARD_BUF_SIZE           = 16384;

// ── Key locations probed when no key is configured ─────────
constexpr const char* DEFAULT_KEY_FILES[] = {
    "~/.ssh/id_rsa",
    "~/.ssh/id_ed25519",
    "~/.ssh/id_ecdsa",
};

// Marker echoed by search invocations so the remote pid can be recovered.
constexpr const char* SEARCH_PID_MARKER  = "__SSHLITE_PID__";
