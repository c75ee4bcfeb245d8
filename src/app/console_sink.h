#ifndef CONSOLE_SINK_H
#define CONSOLE_SINK_H

#include <QFile>
#include <QJsonObject>
#include <QObject>

#include "app/console_controller.h"

// UI sink for the headless host: one compact JSON object per line on stdout.
// Diagnostics stay on stderr (qInfo/qWarning), so stdout can be piped.
class ConsoleSink : public QObject
{
    Q_OBJECT

  public:
    explicit ConsoleSink(QObject *parent = nullptr);

    void setShowToolCalls(bool show) { showToolCalls_ = show; }
    void setStreamTokens(bool stream) { streamTokens_ = stream; }
    int linesWritten() const { return linesWritten_; }
    // Redirect output away from stdout; the device is not owned.
    void setOutput(QIODevice *device) { device_ = device; }

  public slots:
    void onBackendState(BackendState state);
    void onStartFinished(const BackendStartResult &result);
    void onBackendCrashed(int exitCode, const QString &reason);
    void onStatus(const BackendStatus &status);
    void onChatEvent(quint64 sessionId, const StreamEvent &event);
    void onChatFinished(quint64 sessionId, const StreamResult &result);
    void onConnectionTest(const ConnectionTestResult &result);

  private:
    void write(const QJsonObject &line);
    void flushTokens(quint64 sessionId);

    QFile out_;
    QIODevice *device_ = nullptr;
    bool showToolCalls_ = true;
    bool streamTokens_ = true;
    QString tokenBuffer_; // tokens held back when streamTokens_ is off
    int linesWritten_ = 0;
};

#endif // CONSOLE_SINK_H
