#include "service/net/net_client.h"

ChatClient::ChatClient(QObject *parent)
    : QObject(parent)
{
    proxy_ = new StreamProxy(this);
    registry_ = new RequestRegistry(this);
}

ChatClient::~ChatClient() = default;

void ChatClient::setPort(int port)
{
    proxy_->setPort(port);
}

void ChatClient::setDefaultModel(const QString &model)
{
    proxy_->setDefaultModel(model);
}

quint64 ChatClient::streamChat(const ChatRequest &request)
{
    StreamSession *session = proxy_->streamChat(request);
    // 先登记再转发：旧会话在 track() 内被取消，不会与新会话交错
    registry_->track(session);
    connect(session, &StreamSession::eventArrived, this, &ChatClient::chatEvent);
    connect(session, &StreamSession::finished, this, &ChatClient::chatFinished);
    return session->id();
}

CancelResult ChatClient::cancel()
{
    return registry_->cancel();
}
