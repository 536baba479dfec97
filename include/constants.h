#ifndef PGUARD_CONSTANTS_H
#define PGUARD_CONSTANTS_H

#include <cstdint>

// Config
static constexpr char CONFIG_FILENAME[] = "pguard.json";
static constexpr int CONFIG_VERSION = 2; // Increment when config structure changes

// Journal / IPC defaults (relative to GetLogPath())
static constexpr char JOURNAL_FILENAME[] = "outcomes.jsonl";
static constexpr char SOCKET_FILENAME[] = "pguard.sock";

// Timeouts (milliseconds)
static constexpr uint32_t DEFAULT_HANDLER_TIMEOUT_MS = 5000;
static constexpr uint32_t DEFAULT_COMMAND_TIMEOUT_MS = 3000;
static constexpr uint32_t MIN_TIMEOUT_MS = 100;
static constexpr uint32_t MAX_TIMEOUT_MS = 60000;

// Usage alert defaults
static constexpr int DEFAULT_BATTERY_ALERT_PERCENT = 20;
static constexpr int DEFAULT_DATA_ALERT_MB = 1000;

// Identity of the host application (never a termination/throttle target)
static constexpr char DEFAULT_SELF_PACKAGE[] = "com.hackathon.powerguard";

// Force-stopping a package that does not exist still passes the permission check
static constexpr char PROBE_SENTINEL_PACKAGE[] = "pguard.probe.invalid";

// Android standby bucket values (UsageStatsManager)
static constexpr int STANDBY_BUCKET_ACTIVE      = 10;
static constexpr int STANDBY_BUCKET_WORKING_SET = 20;
static constexpr int STANDBY_BUCKET_FREQUENT    = 30;
static constexpr int STANDBY_BUCKET_RARE        = 40;
static constexpr int STANDBY_BUCKET_RESTRICTED  = 50;

// Platform revisions where a primary mechanism first appears
static constexpr int API_LEVEL_STANDBY_BUCKETS = 28; // Android 9
static constexpr int API_LEVEL_NETPOLICY_DENYLIST = 31; // Android 12

// Linux capability bits (CapEff)
static constexpr int CAP_BIT_KILL = 5;
static constexpr int CAP_BIT_SYS_NICE = 23;

// IPC rate limit: requests per second per caller pid
static constexpr int IPC_MAX_TOKENS = 10;
static constexpr size_t IPC_MAX_REQUEST_BYTES = 1 << 20;

// Default config template
static constexpr const char* DEFAULT_CONFIG = R"({
    "version": 2,
    "self_package": "com.hackathon.powerguard",
    "protected_packages": [
        "android",
        "com.android.systemui",
        "com.android.phone",
        "com.android.settings"
    ],
    "handler_timeout_ms": 5000,
    "command_timeout_ms": 3000,
    "journal_path": "",
    "log_dir": "",
    "socket_path": "",
    "battery_alert_default": 20,
    "data_alert_default_mb": 1000,
    "ipc_allowed_uids": []
}
)";

#endif // PGUARD_CONSTANTS_H
