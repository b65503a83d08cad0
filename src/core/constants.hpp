#pragma once

#include <cstddef>

// ── Version ─────────────────────────────────────────────────
constexpr const char* SSHM_VERSION = "0.4.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP dial, handshake, auth per hop
constexpr int RESIZE_FORWARD_TIMEOUT_MS  = 100;   // window-change abandoned after this
constexpr int INPUT_DRAIN_TIMEOUT_MS     = 100;   // wait for stdin copier after session exit
constexpr int SESSION_GRACE_MS           = 500;   // wait for remote exit after stdin EOF
constexpr int SOCKET_WAIT_SLICE_MS       = 50;    // poll slice inside libssh2 EAGAIN loops
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t SSH_READ_BUF_SIZE       = 16384;
constexpr size_t TRANSFER_BUF_SIZE       = 1024 * 1024;   // 1 MiB copy buffer
constexpr size_t PROGRESS_BATCH_BYTES    = 512 * 1024;    // progress flushed every 512 KiB

// ── Session defaults ────────────────────────────────────────
constexpr const char* DEFAULT_TERM_TYPE  = "xterm-256color";
constexpr int DEFAULT_TERM_WIDTH         = 80;
constexpr int DEFAULT_TERM_HEIGHT        = 24;
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Config files ────────────────────────────────────────────
// Loaded and merged in this order when no --config is given.
constexpr const char* CONFIG_FILE_NAMES[] = {".sshm.yaml", ".sshw.yaml"};

// ── Authentication ──────────────────────────────────────────
// Tried in order; the first readable one is offered.
constexpr const char* DEFAULT_KEY_FILES[] = {
    ".ssh/id_ed25519",
    ".ssh/id_rsa",
    ".ssh/id_ecdsa",
    ".ssh/id_dsa",
};
