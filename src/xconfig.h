#ifndef XCONFIG_H
#define XCONFIG_H

#include <QMetaType>
#include <QString>
#include <QStringList>

// 默认约定
#define DEFAULT_SERVER_HOST "127.0.0.1" // IPv4 loopback, never "localhost" (dual-stack lookups may pick ::1)
#define DEFAULT_SERVER_PORT 8765
#define DEFAULT_MODEL "gpt-5.2"
#define DEFAULT_MYSQL_PORT "3306"
#define DEFAULT_SERVER_SCRIPT "msconsole_server.py"
#define DEFAULT_CONFIG_FILE "msconsole_config.ini"

// 后端接口
#define HEALTH_ENDPOINT "/health"
#define TEST_CONNECTION_ENDPOINT "/test-connection"
#define CHAT_STREAM_ENDPOINT "/chat/stream"
#define SSE_DATA_PREFIX "data: "

// 不同操作系统相关
#ifdef _WIN32
#define DEFAULT_PYTHON "python"
#else
#define DEFAULT_PYTHON "python3"
#endif

// Readiness markers printed by the backend (uvicorn logs to stderr, the banner goes to stdout)
inline QStringList backendReadyMarkers(bool fromStdErr)
{
    if (fromStdErr)
    {
        return {QStringLiteral("Uvicorn running"), QStringLiteral("Started server"), QStringLiteral("Application startup complete")};
    }
    return {QStringLiteral("Server started"), QStringLiteral("Uvicorn running"), QStringLiteral("Application startup complete")};
}

// Connection settings handed to the backend process plus UI flags.
// The backend only sees what buildBackendEnvironment() exports.
struct ConsoleSettings
{
    QString openaiApiKey;
    QString model = QStringLiteral(DEFAULT_MODEL);
    QString mysqlHost;
    QString mysqlPort = QStringLiteral(DEFAULT_MYSQL_PORT);
    QString mysqlUsername;
    QString mysqlPassword;
    QString mysqlDatabase;
    bool showToolCalls = true;
    bool streamTokens = true;
};

// Fixed waits used by the supervisor. Tests shrink them.
struct SupervisorTimings
{
    int graceWindowMs = 3000;   // wait for a readiness marker before probing /health
    int fallbackRetries = 5;    // probe retries after the grace window
    int fallbackDelayMs = 1000; // spacing between probe attempts
    int probeTimeoutMs = 5000;  // per-attempt HTTP timeout
    int restartDelayMs = 1000;  // pause between stop() and start() on restart()
    int killGuardMs = 1500;     // SIGKILL if SIGTERM did not end the process in time
};

// 后端进程状态机：仅 BackendSupervisor 可以写入
enum class BackendState
{
    Stopped,
    Starting,
    Ready,
    Degraded, // process alive, readiness never confirmed (soft start failure)
    Crashed
};

inline QString backendStateName(BackendState state)
{
    switch (state)
    {
    case BackendState::Stopped: return QStringLiteral("stopped");
    case BackendState::Starting: return QStringLiteral("starting");
    case BackendState::Ready: return QStringLiteral("ready");
    case BackendState::Degraded: return QStringLiteral("degraded");
    case BackendState::Crashed: return QStringLiteral("crashed");
    }
    return QStringLiteral("unknown");
}

inline bool isBackendTransitionAllowed(BackendState from, BackendState to)
{
    switch (from)
    {
    case BackendState::Stopped:
        return to == BackendState::Starting;
    case BackendState::Starting:
        return to == BackendState::Ready || to == BackendState::Degraded || to == BackendState::Stopped || to == BackendState::Crashed;
    case BackendState::Ready:
        return to == BackendState::Stopped || to == BackendState::Crashed;
    case BackendState::Degraded:
        return to == BackendState::Ready || to == BackendState::Stopped || to == BackendState::Crashed;
    case BackendState::Crashed:
        return to == BackendState::Starting || to == BackendState::Stopped;
    }
    return false;
}

Q_DECLARE_METATYPE(BackendState)

#endif // XCONFIG_H
