#ifndef CONNECTION_TESTER_H
#define CONNECTION_TESTER_H

#include <QJsonObject>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>

class HealthChecker;
struct HealthCheckResult;
class QNetworkAccessManager;
class QNetworkReply;

struct ConnectionTestResult
{
    bool success = false;
    QJsonObject results; // per-dependency report from the backend, if any
    QString error;
};

// Asks the backend to verify its own upstream connections (model API and
// database): /health first, then POST /test-connection {"test": true}.
class ConnectionTester : public QObject
{
    Q_OBJECT

  public:
    ConnectionTester(HealthChecker *health, QObject *parent = nullptr);

    void setPort(int port);
    void setRequestTimeoutMs(int ms);

    // Result arrives through finished(). A test already running is superseded.
    void run();
    bool isRunning() const { return healthProbeId_ != 0 || reply_; }

  signals:
    void finished(const ConnectionTestResult &result);

  private:
    void onHealthFinished(quint64 probeId, const HealthCheckResult &result);
    void postTestRequest();
    void onReplyFinished(QNetworkReply *reply);
    void finish(const ConnectionTestResult &result);

    HealthChecker *health_ = nullptr;
    QNetworkAccessManager *nam_ = nullptr;
    QPointer<QNetworkReply> reply_;
    quint64 healthProbeId_ = 0;
    int port_;
    int requestTimeoutMs_ = 30000;
};

Q_DECLARE_METATYPE(ConnectionTestResult)

#endif // CONNECTION_TESTER_H
