#include "console_controller.h"

#include "service/backend/health_checker.h"
#include "service/net/net_client.h"
#include "utils/flowtracer.h"
#include "utils/settings_change_analyzer.h"

ConsoleController::ConsoleController(const QString &configPath, QObject *parent)
    : QObject(parent), store_(configPath)
{
    qRegisterMetaType<BackendStatus>("BackendStatus");

    health_ = new HealthChecker(this);
    supervisor_ = new BackendSupervisor(health_, this);
    chat_ = new ChatClient(this);
    tester_ = new ConnectionTester(health_, this);

    connect(supervisor_, &BackendSupervisor::stateChanged, this, &ConsoleController::backendStateChanged);
    connect(supervisor_, &BackendSupervisor::startFinished, this, &ConsoleController::backendStartFinished);
    connect(supervisor_, &BackendSupervisor::serverOutput, this, &ConsoleController::backendOutput);
    connect(supervisor_, &BackendSupervisor::crashed, this, &ConsoleController::backendCrashed);
    connect(chat_, &ChatClient::chatEvent, this, &ConsoleController::chatEvent);
    connect(chat_, &ChatClient::chatFinished, this, &ConsoleController::chatFinished);
    connect(tester_, &ConnectionTester::finished, this, &ConsoleController::connectionTestFinished);
    connect(health_, &HealthChecker::probeFinished, this, &ConsoleController::onStatusProbeFinished);

    pushSettings(store_.load());
    setPort(DEFAULT_SERVER_PORT);
}

ConsoleController::~ConsoleController()
{
    // 退出时不留下孤儿进程
    supervisor_->stop();
}

void ConsoleController::setLaunchSpec(const BackendLaunchSpec &spec)
{
    supervisor_->setLaunchSpec(spec);
}

void ConsoleController::setPort(int port)
{
    supervisor_->setPort(port);
    health_->setPort(port);
    chat_->setPort(port);
    tester_->setPort(port);
}

void ConsoleController::setTimings(const SupervisorTimings &timings)
{
    supervisor_->setTimings(timings);
    health_->setAttemptTimeoutMs(timings.probeTimeoutMs);
}

void ConsoleController::setConnectionTestTimeoutMs(int ms)
{
    tester_->setRequestTimeoutMs(ms);
}

void ConsoleController::pushSettings(const ConsoleSettings &settings)
{
    supervisor_->setSettings(settings);
    chat_->setDefaultModel(settings.model);
}

void ConsoleController::startBackend()
{
    pushSettings(store_.load());
    supervisor_->start();
}

void ConsoleController::stopBackend()
{
    supervisor_->stop();
}

void ConsoleController::restartBackend()
{
    pushSettings(store_.load());
    supervisor_->restart();
}

int ConsoleController::port() const
{
    return supervisor_->port();
}

void ConsoleController::requestStatus()
{
    BackendStatus status;
    status.port = supervisor_->port();
    switch (supervisor_->state())
    {
    case BackendState::Stopped:
        if (!supervisor_->isRestartPending())
        {
            status.status = QStringLiteral("stopped");
            status.message = QStringLiteral("Python backend not running");
            emit statusReady(status);
            return;
        }
        status.status = QStringLiteral("starting");
        status.message = QStringLiteral("Backend is restarting");
        emit statusReady(status);
        return;
    case BackendState::Starting:
        status.status = QStringLiteral("starting");
        status.message = QStringLiteral("Backend is starting");
        emit statusReady(status);
        return;
    case BackendState::Crashed:
        status.status = QStringLiteral("crashed");
        status.message = QStringLiteral("Python backend exited unexpectedly");
        emit statusReady(status);
        return;
    case BackendState::Ready:
    case BackendState::Degraded:
        break;
    }

    // 单次探测：0 次重试
    const quint64 probeId = health_->probe(0, 0);
    statusProbes_.insert(probeId);
    statusGeneration_.insert(probeId, supervisor_->generation());
}

void ConsoleController::onStatusProbeFinished(quint64 probeId, const HealthCheckResult &result)
{
    if (!statusProbes_.remove(probeId)) return;
    const quint64 generation = statusGeneration_.take(probeId);

    BackendStatus status;
    status.port = supervisor_->port();
    if (result.ok())
    {
        supervisor_->confirmReady(generation);
        status.status = QStringLiteral("running");
        status.message = QStringLiteral("Backend is healthy");
    }
    else if (supervisor_->state() == BackendState::Degraded)
    {
        status.status = QStringLiteral("degraded");
        status.message = result.message;
    }
    else
    {
        status.status = QStringLiteral("error");
        status.message = result.message;
    }
    FlowTracer::log(FlowChannel::Health, QStringLiteral("status: %1 (%2)").arg(status.status, status.message));
    emit statusReady(status);
}

void ConsoleController::applySettings(const ConsoleSettings &settings)
{
    const ConsoleSettings before = store_.load();
    const SettingsChangeSummary summary = analyzeSettingsChanges(before, settings);
    if (!store_.save(settings))
    {
        FlowTracer::warn(FlowChannel::Settings, QStringLiteral("settings: save failed for %1").arg(store_.filePath()));
    }
    pushSettings(settings);

    if (!summary.hasAnyChange) return;
    FlowTracer::log(FlowChannel::Settings, QStringLiteral("settings changed: restart=[%1] ui=[%2]")
                                               .arg(compactChangeItems(summary.restartItems), compactChangeItems(summary.uiItems)));
    // saving connection settings also brings a stopped or crashed backend back up
    if (summary.requiresBackendRestart)
    {
        FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("restarting backend for new settings (was %1)")
                                                    .arg(backendStateName(supervisor_->state())));
        supervisor_->restart();
    }
}

bool ConsoleController::setSetting(const QString &key, const QVariant &value)
{
    const QVariant previous = store_.value(key);
    if (!store_.setValue(key, value)) return false;
    pushSettings(store_.load());

    if (ConfigStore::isConnectionKey(key) && previous != value && supervisor_->isRunning())
    {
        FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("restarting backend for %1").arg(key));
        supervisor_->restart();
    }
    return true;
}

quint64 ConsoleController::streamChat(const QString &message, const QList<ChatMessage> &history, const QString &model)
{
    ChatRequest request;
    request.message = message;
    request.history = history;
    request.model = model;
    return chat_->streamChat(request);
}

CancelResult ConsoleController::cancelChat()
{
    return chat_->cancel();
}

void ConsoleController::testConnection()
{
    tester_->run();
}
