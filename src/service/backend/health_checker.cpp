#include "service/backend/health_checker.h"

#include "utils/flowtracer.h"
#include "xconfig.h"

#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace
{
const char *kTimedOutProperty = "msc_timed_out";
}

QString healthOutcomeName(HealthCheckResult::Outcome outcome)
{
    switch (outcome)
    {
    case HealthCheckResult::Outcome::Ok: return QStringLiteral("ok");
    case HealthCheckResult::Outcome::Unreachable: return QStringLiteral("unreachable");
    case HealthCheckResult::Outcome::Timeout: return QStringLiteral("timeout");
    case HealthCheckResult::Outcome::BadStatus: return QStringLiteral("bad_status");
    }
    return QStringLiteral("unknown");
}

MscErrorCode healthErrorCode(const HealthCheckResult &result)
{
    switch (result.outcome)
    {
    case HealthCheckResult::Outcome::Unreachable: return MscErrorCode::HcUnreachable;
    case HealthCheckResult::Outcome::Timeout: return MscErrorCode::HcTimeout;
    case HealthCheckResult::Outcome::BadStatus: return MscErrorCode::HcBadStatus;
    case HealthCheckResult::Outcome::Ok:
    default:
        break;
    }
    return MscErrorCode::None;
}

HealthChecker::HealthChecker(QObject *parent)
    : QObject(parent), port_(DEFAULT_SERVER_PORT)
{
    qRegisterMetaType<HealthCheckResult>("HealthCheckResult");
    nam_ = new QNetworkAccessManager(this);
    // loopback only: never route through a system proxy
    nam_->setProxy(QNetworkProxy::NoProxy);
}

HealthChecker::~HealthChecker()
{
    cancelAll();
}

void HealthChecker::setPort(int port)
{
    port_ = port;
}

void HealthChecker::setAttemptTimeoutMs(int ms)
{
    attemptTimeoutMs_ = qMax(1, ms);
}

quint64 HealthChecker::probe(int retries, int delayMs)
{
    const quint64 id = ++nextProbeId_;
    ProbeRun run;
    run.attemptsLeft = qMax(0, retries);
    run.delayMs = qMax(0, delayMs);
    runs_.insert(id, run);
    FlowTracer::log(FlowChannel::Health, QStringLiteral("probe#%1 start port=%2 retries=%3 delay=%4ms")
                                             .arg(id)
                                             .arg(port_)
                                             .arg(run.attemptsLeft)
                                             .arg(run.delayMs));
    attempt(id);
    return id;
}

void HealthChecker::cancel(quint64 probeId)
{
    auto it = runs_.find(probeId);
    if (it == runs_.end()) return;
    QNetworkReply *reply = it->reply;
    runs_.erase(it);
    if (reply)
    {
        QObject::disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

void HealthChecker::cancelAll()
{
    const QList<quint64> ids = runs_.keys();
    for (quint64 id : ids) cancel(id);
}

void HealthChecker::attempt(quint64 probeId)
{
    auto it = runs_.find(probeId);
    if (it == runs_.end()) return; // cancelled while waiting for the retry delay

    ++it->attempts;
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral(DEFAULT_SERVER_HOST));
    url.setPort(port_);
    url.setPath(QStringLiteral(HEALTH_ENDPOINT));

    QNetworkRequest req(url);
    // a redirect is an answer of its own; only a direct 200 counts as healthy
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    QNetworkReply *reply = nam_->get(req);
    it->reply = reply;

    // Per-attempt client timeout; aborting makes finished() fire with OperationCanceledError.
    QTimer *timer = new QTimer(reply);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, reply, [reply]()
            {
        reply->setProperty(kTimedOutProperty, true);
        reply->abort(); });
    timer->start(attemptTimeoutMs_);

    connect(reply, &QNetworkReply::finished, this, [this, probeId, reply]()
            { onAttemptFinished(probeId, reply); });
}

void HealthChecker::onAttemptFinished(quint64 probeId, QNetworkReply *reply)
{
    reply->deleteLater();
    auto it = runs_.find(probeId);
    if (it == runs_.end() || it->reply != reply) return; // stale attempt
    it->reply = nullptr;

    HealthCheckResult result;
    result.attempts = it->attempts;
    const QVariant codeVar = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    result.httpStatus = codeVar.isValid() ? codeVar.toInt() : 0;

    if (reply->property(kTimedOutProperty).toBool())
    {
        result.outcome = HealthCheckResult::Outcome::Timeout;
        result.message = QStringLiteral("Health check timeout");
    }
    else if (result.httpStatus == 200)
    {
        result.outcome = HealthCheckResult::Outcome::Ok;
    }
    else if (result.httpStatus > 0)
    {
        result.outcome = HealthCheckResult::Outcome::BadStatus;
        result.message = QStringLiteral("Health check failed: %1").arg(result.httpStatus);
    }
    else
    {
        result.outcome = HealthCheckResult::Outcome::Unreachable;
        result.message = reply->errorString();
    }

    if (result.ok())
    {
        runs_.erase(it);
        FlowTracer::log(FlowChannel::Health, QStringLiteral("probe#%1 ok after %2 attempt(s)").arg(probeId).arg(result.attempts));
        emit probeFinished(probeId, result);
        return;
    }

    if (it->attemptsLeft > 0)
    {
        --it->attemptsLeft;
        FlowTracer::log(FlowChannel::Health, QStringLiteral("probe#%1 attempt %2 %3 (%4), retry in %5ms")
                                                 .arg(probeId)
                                                 .arg(result.attempts)
                                                 .arg(healthOutcomeName(result.outcome), result.message)
                                                 .arg(it->delayMs));
        QTimer::singleShot(it->delayMs, this, [this, probeId]()
                           { attempt(probeId); });
        return;
    }

    runs_.erase(it);
    FlowTracer::warn(FlowChannel::Health, formatMscError(healthErrorCode(result),
                                                         QStringLiteral("probe#%1 gave up after %2 attempt(s): %3")
                                                             .arg(probeId)
                                                             .arg(result.attempts)
                                                             .arg(result.message)));
    emit probeFinished(probeId, result);
}
