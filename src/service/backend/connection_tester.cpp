#include "service/backend/connection_tester.h"

#include "service/backend/health_checker.h"
#include "utils/flowtracer.h"
#include "xconfig.h"

#include <QJsonDocument>
#include <QJsonParseError>
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

ConnectionTester::ConnectionTester(HealthChecker *health, QObject *parent)
    : QObject(parent), health_(health), port_(DEFAULT_SERVER_PORT)
{
    qRegisterMetaType<ConnectionTestResult>("ConnectionTestResult");
    nam_ = new QNetworkAccessManager(this);
    nam_->setProxy(QNetworkProxy::NoProxy);
    connect(health_, &HealthChecker::probeFinished, this, &ConnectionTester::onHealthFinished);
}

void ConnectionTester::setPort(int port)
{
    port_ = port;
}

void ConnectionTester::setRequestTimeoutMs(int ms)
{
    requestTimeoutMs_ = qMax(1, ms);
}

void ConnectionTester::run()
{
    if (healthProbeId_ != 0) health_->cancel(healthProbeId_);
    healthProbeId_ = 0;
    if (reply_)
    {
        QNetworkReply *old = reply_;
        reply_.clear();
        QObject::disconnect(old, nullptr, this, nullptr);
        old->abort();
        old->deleteLater();
    }
    FlowTracer::log(FlowChannel::Health, QStringLiteral("connection test: start"));
    health_->setPort(port_);
    healthProbeId_ = health_->probe(0, 0);
}

void ConnectionTester::onHealthFinished(quint64 probeId, const HealthCheckResult &result)
{
    if (probeId == 0 || probeId != healthProbeId_) return;
    healthProbeId_ = 0;
    if (!result.ok())
    {
        ConnectionTestResult out;
        out.error = result.message;
        finish(out);
        return;
    }
    postTestRequest();
}

void ConnectionTester::postTestRequest()
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral(DEFAULT_SERVER_HOST));
    url.setPort(port_);
    url.setPath(QStringLiteral(TEST_CONNECTION_ENDPOINT));

    const QByteArray body = QJsonDocument(QJsonObject{{QStringLiteral("test"), true}}).toJson(QJsonDocument::Compact);
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setHeader(QNetworkRequest::ContentLengthHeader, body.size());

    QNetworkReply *reply = nam_->post(req, body);
    reply_ = reply;
    QTimer *timer = new QTimer(reply);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, reply, [reply]()
            {
        reply->setProperty(kTimedOutProperty, true);
        reply->abort(); });
    timer->start(requestTimeoutMs_);
    connect(reply, &QNetworkReply::finished, this, [this, reply]()
            { onReplyFinished(reply); });
}

void ConnectionTester::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();
    if (reply != reply_) return;
    reply_.clear();

    ConnectionTestResult out;
    if (reply->property(kTimedOutProperty).toBool())
    {
        out.error = QStringLiteral("Connection test timeout");
        finish(out);
        return;
    }

    const QByteArray body = reply->readAll();
    const QVariant codeVar = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!codeVar.isValid())
    {
        out.error = reply->errorString();
        finish(out);
        return;
    }

    // whatever status came back, a JSON body is the answer
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject())
    {
        out.error = QStringLiteral("Invalid response");
        finish(out);
        return;
    }
    const QJsonObject obj = doc.object();
    out.success = obj.value(QStringLiteral("success")).toBool(false);
    out.results = obj.value(QStringLiteral("results")).toObject();
    out.error = obj.value(QStringLiteral("error")).toString();
    finish(out);
}

void ConnectionTester::finish(const ConnectionTestResult &result)
{
    FlowTracer::log(FlowChannel::Health, QStringLiteral("connection test: %1%2")
                                             .arg(result.success ? QStringLiteral("success") : QStringLiteral("failed"))
                                             .arg(result.error.isEmpty() ? QString() : QStringLiteral(" (%1)").arg(result.error)));
    emit finished(result);
}
