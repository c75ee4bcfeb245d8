#pragma once

#include <QObject>

#include "service/net/request_registry.h"
#include "xnet.h"

// Chat client: StreamProxy + RequestRegistry behind one API. The signals are
// the delivery channel to the UI; every payload carries its session id so a
// receiver can drop anything from a session it no longer shows.
class ChatClient : public QObject
{
    Q_OBJECT
public:
    explicit ChatClient(QObject *parent = nullptr);
    ~ChatClient() override;

    void setPort(int port);
    void setDefaultModel(const QString &model);

    // Start a streamed exchange; a still-running one is cancelled first.
    quint64 streamChat(const ChatRequest &request);
    CancelResult cancel();
    quint64 activeSessionId() const { return registry_->activeId(); }

signals:
    void chatEvent(quint64 sessionId, const StreamEvent &event);
    void chatFinished(quint64 sessionId, const StreamResult &result);

private:
    StreamProxy *proxy_ = nullptr;
    RequestRegistry *registry_ = nullptr;
};
