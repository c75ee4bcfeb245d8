#ifndef XNET_H
#define XNET_H

#include "service/net/sse_line_buffer.h"
#include "service/net/stream_event.h"

#include <QByteArray>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;
class QUrl;

struct ChatMessage
{
    QString role;
    QString content;
};

// One /chat/stream request. Built by the caller, consumed once.
struct ChatRequest
{
    QString message;
    QList<ChatMessage> history;
    QString model;

    // {"message", "conversation_history": [{role, content}], "model"}
    QByteArray toJsonBody(const QString &fallbackModel) const;
};

struct StreamResult
{
    bool success = false;
    bool cancelled = false;
    QString error;
};

// A single in-flight streamed request. Created by StreamProxy::streamChat(),
// deletes itself after finished() was emitted.
class StreamSession : public QObject
{
    Q_OBJECT

  public:
    ~StreamSession() override;

    quint64 id() const { return id_; }
    bool isActive() const { return !done_; }
    bool isCancelled() const { return cancelled_; }
    int eventCount() const { return eventCount_; }
    int skippedFrames() const { return skippedFrames_; }
    const QByteArray &pendingFragment() const { return lines_.remainder(); }

    // Tear the connection down now. No event is delivered afterwards and
    // finished() follows on the next event-loop turn with cancelled = true.
    // Returns false when the session had already ended.
    bool cancel();

  signals:
    void eventArrived(quint64 sessionId, const StreamEvent &event);
    void finished(quint64 sessionId, const StreamResult &result);

  private:
    friend class StreamProxy;
    StreamSession(quint64 id, QNetworkReply *reply, QObject *parent);

    void onReadyRead();
    void onFinished();
    int httpStatus() const;
    void consumeLines(const QList<QByteArray> &lines);
    void forward(const StreamEvent &event);
    void resolve(const StreamResult &result);
    void detachReply();

    quint64 id_ = 0;
    QPointer<QNetworkReply> reply_;
    SseLineBuffer lines_;
    QByteArray errorBody_; // body of a non-2xx reply, read in full before reporting
    bool cancelled_ = false;
    bool done_ = false;
    int eventCount_ = 0;
    int skippedFrames_ = 0;
};

// Client of the backend's /chat/stream endpoint.
class StreamProxy : public QObject
{
    Q_OBJECT

  public:
    explicit StreamProxy(QObject *parent = nullptr);
    ~StreamProxy() override;

    void setPort(int port);
    int port() const { return port_; }
    void setDefaultModel(const QString &model);

    // Open the request and return its session. Events and the final result
    // are delivered through the session's signals.
    StreamSession *streamChat(const ChatRequest &request);

  private:
    QNetworkRequest buildRequest(const QUrl &url, int bodySize) const;

    QNetworkAccessManager *nam_ = nullptr;
    int port_;
    QString defaultModel_;
    quint64 nextSessionId_ = 0;
};

Q_DECLARE_METATYPE(StreamResult)

#endif // XNET_H
