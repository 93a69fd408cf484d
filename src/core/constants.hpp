#pragma once

// ── External programs ───────────────────────────────────────
constexpr const char* SSH_PROGRAM     = "ssh";
constexpr const char* SSHPASS_PROGRAM = "sshpass";
constexpr const char* SSHPASS_ENV     = "SSHPASS";    // read by `sshpass -e`

// ── SSH options ─────────────────────────────────────────────
constexpr const char* SSH_OPT_NO_HOST_KEY_CHECK = "StrictHostKeyChecking=no";
constexpr const char* SSH_OPT_NO_PUBKEY         = "PubkeyAuthentication=no";

constexpr int MAX_VERBOSITY = 3;                      // ssh stops at -vvv

// ── Config defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_SSH_PORT    = "22";
constexpr const char* DEFAULT_TUNNEL_PORT = "1080";
constexpr const char* CONFIG_ENV          = "SSM_CONFIG";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_USAGE       = 2;
constexpr int EXIT_INTERRUPTED = 130;                 // 128 + SIGINT
