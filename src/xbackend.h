// Supervisor for the local backend server process
#ifndef XBACKEND_H
#define XBACKEND_H

#include "service/backend/backend_launch.h"
#include "utils/msc_error.h"
#include "xconfig.h"

#include <QMetaType>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QTextCodec>

#include <memory>

class HealthChecker;
struct HealthCheckResult;
class QTimer;

struct BackendStartResult
{
    enum class Outcome
    {
        Ready,    // marker seen or /health answered 200
        Degraded, // process alive but readiness never confirmed; advisory only
        Failed    // spawn failed, script missing, or process died before ready
    };

    Outcome outcome = Outcome::Failed;
    MscErrorCode code = MscErrorCode::None;
    QString reason;
    quint64 generation = 0;
};

QString backendStartOutcomeName(BackendStartResult::Outcome outcome);

// Owns the backend process handle and its state machine. Everything runs on the
// owning thread's event loop; callbacks from a replaced process are recognised
// by pointer/generation and dropped.
class BackendSupervisor : public QObject
{
    Q_OBJECT
  public:
    BackendSupervisor(HealthChecker *health, QObject *parent = nullptr);
    ~BackendSupervisor() override;

    void setLaunchSpec(const BackendLaunchSpec &spec);
    void setSettings(const ConsoleSettings &settings);
    void setPort(int port);
    void setTimings(const SupervisorTimings &timings);

    // Spawn the backend and resolve readiness. The outcome arrives through
    // startFinished(). Returns the generation assigned to this start.
    quint64 start();
    // SIGTERM the owned process and forget it immediately. No-op when idle.
    void stop();
    // stop(), wait the restart delay (and for the old process to exit), start().
    void restart();
    // Promote Degraded -> Ready once an external probe confirmed the backend.
    void confirmReady(quint64 generation);

    BackendState state() const { return state_; }
    bool isRunning() const;
    bool isRestartPending() const { return restartPending_; }
    quint64 generation() const { return generation_; }
    int port() const { return port_; }
    QString endpointBase() const; // e.g. http://127.0.0.1:8765
    qint64 processId() const;

  signals:
    void stateChanged(BackendState state);
    void startFinished(const BackendStartResult &result);
    void serverOutput(const QString &chunk, bool fromStdErr);
    // Process exited without stop(). Terminal until an explicit start/restart.
    void crashed(int exitCode, const QString &reason);

  private:
    void setState(BackendState next);
    void hookProcessSignals(QProcess *p);
    void handleOutput(QProcess *p, bool fromStdErr);
    void onGraceWindowElapsed(quint64 generation);
    void onFallbackProbeFinished(quint64 probeId, const HealthCheckResult &result);
    void resolveStart(BackendStartResult::Outcome outcome, MscErrorCode code, const QString &reason);
    void retireProcess(QProcess *p);
    void launchAfterRetire();

    HealthChecker *health_ = nullptr;
    BackendLaunchSpec launch_;
    ConsoleSettings settings_;
    int port_;
    SupervisorTimings timings_;

    QPointer<QProcess> proc_;
    QList<QProcess *> retiring_; // stopped processes still shutting down
    BackendState state_ = BackendState::Stopped;
    quint64 generation_ = 0;

    // 启动阶段状态：marker / 健康检查 / 提前退出 三者中先到者决定结果，只上报一次
    bool startPending_ = false;
    quint64 fallbackProbeId_ = 0;
    QString stdoutTail_;
    QString stderrTail_;
    // stateful per stream: a UTF-8 sequence split between two reads is decoded whole
    std::unique_ptr<QTextDecoder> stdoutDecoder_;
    std::unique_ptr<QTextDecoder> stderrDecoder_;
    int stdoutLogged_ = 0;
    int stderrLogged_ = 0;

    QTimer *restartTimer_ = nullptr;
    bool restartPending_ = false;
};

Q_DECLARE_METATYPE(BackendStartResult)

#endif // XBACKEND_H
