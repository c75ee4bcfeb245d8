#ifndef CONSOLE_CONTROLLER_H
#define CONSOLE_CONTROLLER_H

#include <QHash>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QSet>
#include <QString>
#include <QVariant>

#include "service/backend/connection_tester.h"
#include "storage/config_store.h"
#include "xbackend.h"
#include "xnet.h"

class ChatClient;
struct HealthCheckResult;
class HealthChecker;
struct CancelResult;

// status: stopped | starting | running | degraded | crashed | error
struct BackendStatus
{
    QString status;
    QString message;
    int port = 0;
};

// The control-plane surface offered to a UI: one object owning the config
// store, the backend supervisor and the chat client. All calls and signals
// run on the owning thread.
class ConsoleController : public QObject
{
    Q_OBJECT

  public:
    ConsoleController(const QString &configPath, QObject *parent = nullptr);
    ~ConsoleController() override;

    void setLaunchSpec(const BackendLaunchSpec &spec);
    void setPort(int port);
    void setTimings(const SupervisorTimings &timings);
    void setConnectionTestTimeoutMs(int ms);

    void startBackend();
    void stopBackend();
    void restartBackend();
    // Result arrives through statusReady().
    void requestStatus();
    int port() const;

    ConsoleSettings settings() const { return store_.load(); }
    QVariant setting(const QString &key) const { return store_.value(key); }
    // Persist everything; (re)start the backend when a connection value changed,
    // whether it was running, stopped or crashed.
    void applySettings(const ConsoleSettings &settings);
    // Persist one value; restart when it is connection-relevant and a process runs.
    bool setSetting(const QString &key, const QVariant &value);

    quint64 streamChat(const QString &message, const QList<ChatMessage> &history, const QString &model = QString());
    CancelResult cancelChat();
    void testConnection();

    BackendSupervisor *supervisor() const { return supervisor_; }

  signals:
    void backendStateChanged(BackendState state);
    void backendStartFinished(const BackendStartResult &result);
    void backendOutput(const QString &chunk, bool fromStdErr);
    void backendCrashed(int exitCode, const QString &reason);
    void statusReady(const BackendStatus &status);
    void chatEvent(quint64 sessionId, const StreamEvent &event);
    void chatFinished(quint64 sessionId, const StreamResult &result);
    void connectionTestFinished(const ConnectionTestResult &result);

  private:
    void onStatusProbeFinished(quint64 probeId, const HealthCheckResult &result);
    void pushSettings(const ConsoleSettings &settings);

    ConfigStore store_;
    HealthChecker *health_ = nullptr;
    BackendSupervisor *supervisor_ = nullptr;
    ChatClient *chat_ = nullptr;
    ConnectionTester *tester_ = nullptr;
    QSet<quint64> statusProbes_;
    QHash<quint64, quint64> statusGeneration_; // probe id -> supervisor generation at request time
};

Q_DECLARE_METATYPE(BackendStatus)

#endif // CONSOLE_CONTROLLER_H
