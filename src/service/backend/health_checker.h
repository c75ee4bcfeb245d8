#ifndef HEALTH_CHECKER_H
#define HEALTH_CHECKER_H

#include <QHash>
#include <QMetaType>
#include <QObject>
#include <QString>

#include "utils/msc_error.h"

class QNetworkAccessManager;
class QNetworkReply;

struct HealthCheckResult
{
    enum class Outcome
    {
        Ok,
        Unreachable,
        Timeout,
        BadStatus
    };

    Outcome outcome = Outcome::Unreachable;
    int httpStatus = 0; // last HTTP status seen, 0 when no response arrived
    int attempts = 0;   // attempts actually issued
    QString message;

    bool ok() const { return outcome == Outcome::Ok; }
};

QString healthOutcomeName(HealthCheckResult::Outcome outcome);
MscErrorCode healthErrorCode(const HealthCheckResult &result);

// Bounded-retry readiness probe: GET http://127.0.0.1:<port>/health.
// 每次尝试独立超时；重试间隔固定（非指数退避）。
class HealthChecker : public QObject
{
    Q_OBJECT

  public:
    explicit HealthChecker(QObject *parent = nullptr);
    ~HealthChecker() override;

    void setPort(int port);
    int port() const { return port_; }
    void setAttemptTimeoutMs(int ms);

    // Issue up to retries + 1 attempts spaced by delayMs. The terminal result
    // arrives through probeFinished() with the returned id. Probes are
    // independent; several may run at once.
    quint64 probe(int retries, int delayMs);
    // Drop a running probe. Its probeFinished() is never emitted.
    void cancel(quint64 probeId);
    void cancelAll();
    bool isProbing(quint64 probeId) const { return runs_.contains(probeId); }

  signals:
    void probeFinished(quint64 probeId, const HealthCheckResult &result);

  private:
    struct ProbeRun
    {
        int attemptsLeft = 0;
        int delayMs = 0;
        int attempts = 0;
        QNetworkReply *reply = nullptr;
    };

    void attempt(quint64 probeId);
    void onAttemptFinished(quint64 probeId, QNetworkReply *reply);

    QNetworkAccessManager *nam_ = nullptr;
    int port_;
    int attemptTimeoutMs_ = 5000;
    quint64 nextProbeId_ = 0;
    QHash<quint64, ProbeRun> runs_;
};

Q_DECLARE_METATYPE(HealthCheckResult)

#endif // HEALTH_CHECKER_H
