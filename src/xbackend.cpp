#include "xbackend.h"

#include "service/backend/health_checker.h"
#include "utils/flowtracer.h"

#include <QDir>
#include <QFileInfo>
#include <QTimer>

namespace
{
constexpr int kMaxLoggedChunks = 20;  // per stream and per process; later output only goes to serverOutput()
constexpr int kMarkerTailChars = 64;  // carried over so a marker split across reads is still seen
} // namespace

QString backendStartOutcomeName(BackendStartResult::Outcome outcome)
{
    switch (outcome)
    {
    case BackendStartResult::Outcome::Ready: return QStringLiteral("ready");
    case BackendStartResult::Outcome::Degraded: return QStringLiteral("degraded");
    case BackendStartResult::Outcome::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

BackendSupervisor::BackendSupervisor(HealthChecker *health, QObject *parent)
    : QObject(parent), health_(health), port_(DEFAULT_SERVER_PORT)
{
    qRegisterMetaType<BackendState>("BackendState");
    qRegisterMetaType<BackendStartResult>("BackendStartResult");
    restartTimer_ = new QTimer(this);
    restartTimer_->setSingleShot(true);
    connect(restartTimer_, &QTimer::timeout, this, &BackendSupervisor::launchAfterRetire);
    if (health_)
    {
        connect(health_, &HealthChecker::probeFinished, this, &BackendSupervisor::onFallbackProbeFinished);
    }
}

BackendSupervisor::~BackendSupervisor()
{
    restartPending_ = false;
    stop();
}

void BackendSupervisor::setLaunchSpec(const BackendLaunchSpec &spec)
{
    launch_ = spec;
}

void BackendSupervisor::setSettings(const ConsoleSettings &settings)
{
    settings_ = settings;
}

void BackendSupervisor::setPort(int port)
{
    port_ = port;
}

void BackendSupervisor::setTimings(const SupervisorTimings &timings)
{
    timings_ = timings;
}

bool BackendSupervisor::isRunning() const
{
    return proc_ && proc_->state() != QProcess::NotRunning;
}

QString BackendSupervisor::endpointBase() const
{
    return QStringLiteral("http://%1:%2").arg(QStringLiteral(DEFAULT_SERVER_HOST)).arg(port_);
}

qint64 BackendSupervisor::processId() const
{
    return proc_ ? proc_->processId() : 0;
}

void BackendSupervisor::setState(BackendState next)
{
    if (next == state_) return;
    if (!isBackendTransitionAllowed(state_, next))
    {
        FlowTracer::warn(FlowChannel::Backend, QStringLiteral("backend: illegal transition %1 -> %2 ignored")
                                                   .arg(backendStateName(state_), backendStateName(next)));
        return;
    }
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: %1 -> %2 (gen %3)")
                                              .arg(backendStateName(state_), backendStateName(next))
                                              .arg(generation_));
    state_ = next;
    emit stateChanged(state_);
}

quint64 BackendSupervisor::start()
{
    if (proc_)
    {
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: start ignored, process already owned (%1)").arg(backendStateName(state_)));
        return generation_;
    }
    if (restartPending_)
    {
        // an explicit start supersedes a queued restart
        restartTimer_->stop();
        restartPending_ = false;
    }

    ++generation_;
    startPending_ = true;
    fallbackProbeId_ = 0;
    stdoutTail_.clear();
    stderrTail_.clear();
    QTextCodec *utf8 = QTextCodec::codecForName("UTF-8");
    stdoutDecoder_.reset(utf8->makeDecoder());
    stderrDecoder_.reset(utf8->makeDecoder());
    stdoutLogged_ = 0;
    stderrLogged_ = 0;
    setState(BackendState::Starting);

    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: launch interpreter=%1 script=%2")
                                              .arg(launch_.interpreter, QDir::toNativeSeparators(launch_.scriptPath)));
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: env %1").arg(describeBackendEnvironment(settings_, port_)));

    if (launch_.scriptPath.isEmpty() || !QFileInfo::exists(launch_.scriptPath))
    {
        setState(BackendState::Stopped);
        resolveStart(BackendStartResult::Outcome::Failed, MscErrorCode::BeScriptMissing,
                     QStringLiteral("Python script not found: %1").arg(launch_.scriptPath));
        return generation_;
    }

    QProcess *p = new QProcess(this);
    proc_ = p;
    p->setProgram(launch_.interpreter);
    p->setArguments(QStringList{launch_.scriptPath} + launch_.extraArgs);
    p->setWorkingDirectory(QFileInfo(launch_.scriptPath).absolutePath());
    p->setProcessEnvironment(buildBackendEnvironment(settings_, port_));
    hookProcessSignals(p);

    const quint64 gen = generation_;
    QTimer::singleShot(timings_.graceWindowMs, this, [this, gen]()
                       { onGraceWindowElapsed(gen); });
    p->start(QIODevice::ReadOnly);
    return gen;
}

void BackendSupervisor::hookProcessSignals(QProcess *p)
{
    // 注意：重启/停止时 proc_ 会被替换；旧进程的迟到信号一律忽略，
    // 避免把“旧进程退出”误判为“新进程崩溃”。
    connect(p, &QProcess::started, this, [this, p]()
            {
        if (p != proc_) return;
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: process started pid=%1").arg(p->processId())); });

    connect(p, &QProcess::readyReadStandardOutput, this, [this, p]()
            {
        if (p != proc_) return;
        handleOutput(p, false); });

    connect(p, &QProcess::readyReadStandardError, this, [this, p]()
            {
        if (p != proc_) return;
        handleOutput(p, true); });

    connect(p, &QProcess::errorOccurred, this, [this, p](QProcess::ProcessError e)
            {
        if (p != proc_) return;
        if (e != QProcess::FailedToStart)
        {
            // crashes are reported again through finished()
            FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: process error %1 (%2)").arg(int(e)).arg(p->errorString()));
            return;
        }
        const QString msg = QStringLiteral("failed to start %1: %2").arg(launch_.interpreter, p->errorString());
        FlowTracer::warn(FlowChannel::Backend, formatMscError(MscErrorCode::BeSpawnFailed, msg));
        proc_.clear();
        p->deleteLater();
        setState(BackendState::Stopped);
        resolveStart(BackendStartResult::Outcome::Failed, MscErrorCode::BeSpawnFailed, msg); });

    connect(p, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, p](int exitCode, QProcess::ExitStatus exitStatus)
            {
        if (p != proc_) return;
        // stop() detaches proc_ before terminating, so any exit seen here was not requested
        proc_.clear();
        p->deleteLater();
        const QString status = (exitStatus == QProcess::CrashExit) ? QStringLiteral("crash") : QStringLiteral("exit");
        const QString reason = QStringLiteral("backend exited (exitCode=%1, exitStatus=%2)").arg(exitCode).arg(status);
        const bool beforeReady = startPending_;
        setState(BackendState::Crashed);
        FlowTracer::warn(FlowChannel::Backend,
                         formatMscError(beforeReady ? MscErrorCode::BeExitedBeforeReady : MscErrorCode::BeCrashed, reason));
        if (beforeReady)
        {
            resolveStart(BackendStartResult::Outcome::Failed, MscErrorCode::BeExitedBeforeReady, reason);
        }
        emit crashed(exitCode, reason); });
}

void BackendSupervisor::handleOutput(QProcess *p, bool fromStdErr)
{
    const QByteArray raw = fromStdErr ? p->readAllStandardError() : p->readAllStandardOutput();
    if (raw.isEmpty()) return;
    QTextDecoder *decoder = fromStdErr ? stderrDecoder_.get() : stdoutDecoder_.get();
    const QString text = decoder ? decoder->toUnicode(raw) : QString::fromUtf8(raw);
    if (text.isEmpty()) return; // only the head of a multibyte sequence so far
    emit serverOutput(text, fromStdErr);

    int &logged = fromStdErr ? stderrLogged_ : stdoutLogged_;
    if (logged < kMaxLoggedChunks)
    {
        ++logged;
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("[%1 %2] %3")
                                                  .arg(fromStdErr ? QStringLiteral("stderr") : QStringLiteral("stdout"))
                                                  .arg(logged)
                                                  .arg(text.left(300).trimmed()));
    }

    if (!startPending_) return;
    QString &tail = fromStdErr ? stderrTail_ : stdoutTail_;
    const QString window = tail + text;
    const QStringList markers = backendReadyMarkers(fromStdErr);
    for (const QString &marker : markers)
    {
        if (window.contains(marker))
        {
            resolveStart(BackendStartResult::Outcome::Ready, MscErrorCode::None,
                         QStringLiteral("marker '%1' on %2").arg(marker, fromStdErr ? QStringLiteral("stderr") : QStringLiteral("stdout")));
            return;
        }
    }
    tail = window.right(kMarkerTailChars);
}

void BackendSupervisor::onGraceWindowElapsed(quint64 generation)
{
    if (generation != generation_ || !startPending_ || !proc_) return;
    if (!health_)
    {
        resolveStart(BackendStartResult::Outcome::Degraded, MscErrorCode::None, QStringLiteral("no readiness marker, no health checker"));
        return;
    }
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: no readiness marker after %1ms, checking health...").arg(timings_.graceWindowMs));
    health_->setPort(port_);
    health_->setAttemptTimeoutMs(timings_.probeTimeoutMs);
    fallbackProbeId_ = health_->probe(timings_.fallbackRetries, timings_.fallbackDelayMs);
}

void BackendSupervisor::onFallbackProbeFinished(quint64 probeId, const HealthCheckResult &result)
{
    if (probeId == 0 || probeId != fallbackProbeId_) return;
    fallbackProbeId_ = 0;
    if (!startPending_) return;
    if (result.ok())
    {
        resolveStart(BackendStartResult::Outcome::Ready, MscErrorCode::None, QStringLiteral("health check passed"));
        return;
    }
    // 不视为失败：后端可能仍在初始化，调用方按 Degraded 乐观继续
    FlowTracer::warn(FlowChannel::Backend, QStringLiteral("backend: health check failed, continuing degraded: %1").arg(result.message));
    resolveStart(BackendStartResult::Outcome::Degraded, healthErrorCode(result),
                 QStringLiteral("readiness unconfirmed: %1").arg(result.message));
}

void BackendSupervisor::resolveStart(BackendStartResult::Outcome outcome, MscErrorCode code, const QString &reason)
{
    if (!startPending_) return;
    startPending_ = false;
    if (fallbackProbeId_ != 0 && health_)
    {
        health_->cancel(fallbackProbeId_);
    }
    fallbackProbeId_ = 0;

    if (outcome == BackendStartResult::Outcome::Ready) setState(BackendState::Ready);
    if (outcome == BackendStartResult::Outcome::Degraded) setState(BackendState::Degraded);

    BackendStartResult result;
    result.outcome = outcome;
    result.code = code;
    result.reason = reason;
    result.generation = generation_;
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: start %1 (gen %2) %3")
                                              .arg(backendStartOutcomeName(outcome))
                                              .arg(generation_)
                                              .arg(formatMscError(code, reason)));
    emit startFinished(result);
}

void BackendSupervisor::confirmReady(quint64 generation)
{
    if (generation != generation_ || state_ != BackendState::Degraded) return;
    setState(BackendState::Ready);
}

void BackendSupervisor::stop()
{
    if (restartPending_)
    {
        restartTimer_->stop();
        restartPending_ = false;
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: pending restart cancelled"));
    }
    if (!proc_) return;

    QProcess *p = proc_;
    proc_.clear();
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: stopping pid=%1").arg(p->processId()));
    if (startPending_)
    {
        resolveStart(BackendStartResult::Outcome::Failed, MscErrorCode::None, QStringLiteral("stopped before ready"));
    }
    setState(BackendState::Stopped);
    retireProcess(p);
}

void BackendSupervisor::retireProcess(QProcess *p)
{
    QObject::disconnect(p, nullptr, this, nullptr);
    if (p->state() == QProcess::NotRunning)
    {
        p->deleteLater();
        return;
    }

    retiring_.append(p);
    connect(p, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, p](int exitCode, QProcess::ExitStatus)
            {
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: stopped process exited (exitCode=%1)").arg(exitCode));
        retiring_.removeAll(p);
        p->deleteLater();
        if (restartPending_ && !restartTimer_->isActive()) launchAfterRetire(); });

    p->terminate();
    // Guard: SIGKILL if SIGTERM is ignored, so a restart never waits forever
    QTimer::singleShot(timings_.killGuardMs, p, [p]()
                       {
        if (p->state() == QProcess::NotRunning) return;
        FlowTracer::warn(FlowChannel::Backend, QStringLiteral("backend: pid=%1 ignored SIGTERM, killing").arg(p->processId()));
        p->kill(); });
}

void BackendSupervisor::restart()
{
    FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: restart requested (delay %1ms)").arg(timings_.restartDelayMs));
    stop();
    restartPending_ = true;
    restartTimer_->start(timings_.restartDelayMs);
}

void BackendSupervisor::launchAfterRetire()
{
    if (!restartPending_) return;
    if (!retiring_.isEmpty())
    {
        // the old process may still own the port
        FlowTracer::log(FlowChannel::Backend, QStringLiteral("backend: restart waiting for %1 process(es) to exit").arg(retiring_.size()));
        return;
    }
    restartPending_ = false;
    start();
}
