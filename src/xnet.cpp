#include "xnet.h"

#include "utils/flowtracer.h"
#include "utils/msc_error.h"
#include "xconfig.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

namespace
{
bool isSuccessStatus(int code)
{
    return code >= 200 && code < 300;
}

QString preview(const QString &text, int maxChars)
{
    if (text.size() <= maxChars) return text;
    return text.left(maxChars) + QStringLiteral("...");
}
} // namespace

QByteArray ChatRequest::toJsonBody(const QString &fallbackModel) const
{
    QJsonArray historyArr;
    for (const ChatMessage &m : history)
    {
        QJsonObject item;
        item.insert(QStringLiteral("role"), m.role);
        item.insert(QStringLiteral("content"), m.content);
        historyArr.append(item);
    }

    QString effectiveModel = model.trimmed();
    if (effectiveModel.isEmpty()) effectiveModel = fallbackModel.trimmed();
    if (effectiveModel.isEmpty()) effectiveModel = QStringLiteral(DEFAULT_MODEL);

    QJsonObject json;
    json.insert(QStringLiteral("message"), message);
    json.insert(QStringLiteral("conversation_history"), historyArr);
    json.insert(QStringLiteral("model"), effectiveModel);
    return QJsonDocument(json).toJson(QJsonDocument::Compact);
}

// -------------------- StreamSession --------------------

StreamSession::StreamSession(quint64 id, QNetworkReply *reply, QObject *parent)
    : QObject(parent), id_(id), reply_(reply)
{
    connect(reply, &QNetworkReply::readyRead, this, &StreamSession::onReadyRead);
    connect(reply, &QNetworkReply::finished, this, &StreamSession::onFinished);
}

StreamSession::~StreamSession()
{
    if (reply_)
    {
        detachReply();
    }
}

int StreamSession::httpStatus() const
{
    if (!reply_) return 0;
    const QVariant codeVar = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    return codeVar.isValid() ? codeVar.toInt() : 0;
}

void StreamSession::detachReply()
{
    QNetworkReply *reply = reply_;
    reply_.clear();
    if (!reply) return;
    // disconnect first so abort() cannot re-enter onFinished()
    QObject::disconnect(reply, nullptr, this, nullptr);
    reply->abort();
    reply->deleteLater();
}

void StreamSession::onReadyRead()
{
    if (done_ || !reply_) return; // late callback after cancel
    const int code = httpStatus();
    const QByteArray chunk = reply_->readAll();
    if (chunk.isEmpty()) return;

    if (code != 0 && !isSuccessStatus(code))
    {
        errorBody_.append(chunk);
        return;
    }
    consumeLines(lines_.append(chunk));
}

void StreamSession::consumeLines(const QList<QByteArray> &lines)
{
    for (const QByteArray &line : lines)
    {
        QByteArray payload;
        if (!SseLineBuffer::dataPayload(line, &payload)) continue;

        StreamEvent event;
        QString parseError;
        if (!parseStreamEvent(payload, &event, &parseError))
        {
            ++skippedFrames_;
            FlowTracer::log(FlowChannel::Net, QStringLiteral("net: frame skipped (%1): %2")
                                                  .arg(parseError, preview(QString::fromUtf8(payload), 80)),
                            id_);
            continue;
        }
        forward(event);
        if (done_) return; // a receiver cancelled us from inside the slot
    }
}

void StreamSession::forward(const StreamEvent &event)
{
    if (done_) return;
    ++eventCount_;
    emit eventArrived(id_, event);
}

void StreamSession::onFinished()
{
    if (done_ || !reply_) return;
    QNetworkReply *reply = reply_;
    const int code = httpStatus();

    if (code != 0 && !isSuccessStatus(code))
    {
        errorBody_.append(reply->readAll());
        const QString body = QString::fromUtf8(errorBody_);
        FlowTracer::warn(FlowChannel::Net, formatMscError(MscErrorCode::NetHttpStatus,
                                                          QStringLiteral("net: error response %1: %2").arg(code).arg(preview(body, 200))),
                         id_);
        forward(ErrorEvent{QStringLiteral("HTTP %1: %2").arg(code).arg(body)});
        StreamResult result;
        result.error = body.isEmpty() ? QStringLiteral("HTTP %1").arg(code) : body;
        resolve(result);
        return;
    }

    if (reply->error() != QNetworkReply::NoError)
    {
        // bytes that arrived together with the error still count
        consumeLines(lines_.append(reply->readAll()));
        if (done_) return;
        const QString message = reply->errorString();
        FlowTracer::warn(FlowChannel::Net, formatMscError(MscErrorCode::NetSocketError, QStringLiteral("net: stream error: %1").arg(message)), id_);
        forward(ErrorEvent{message});
        StreamResult result;
        result.error = message;
        resolve(result);
        return;
    }

    consumeLines(lines_.append(reply->readAll()));
    if (done_) return;
    if (!lines_.remainder().isEmpty())
    {
        FlowTracer::log(FlowChannel::Net, QStringLiteral("net: stream ended with %1 unterminated byte(s)").arg(lines_.remainder().size()), id_);
    }
    FlowTracer::log(FlowChannel::Net, QStringLiteral("net: stream ended events=%1 skipped=%2").arg(eventCount_).arg(skippedFrames_), id_);
    StreamResult result;
    result.success = true;
    resolve(result);
}

void StreamSession::resolve(const StreamResult &result)
{
    if (done_) return;
    done_ = true;
    detachReply();
    emit finished(id_, result);
    deleteLater();
}

bool StreamSession::cancel()
{
    if (done_) return false;
    done_ = true;
    cancelled_ = true;
    FlowTracer::log(FlowChannel::Net, QStringLiteral("net: cancelling request after %1 event(s)").arg(eventCount_), id_);
    detachReply();

    // settle on the next loop turn so callers are not re-entered from cancel()
    QMetaObject::invokeMethod(
        this, [this]()
        {
            StreamResult result;
            result.cancelled = true;
            result.error = QStringLiteral("cancelled");
            emit finished(id_, result);
            deleteLater(); },
        Qt::QueuedConnection);
    return true;
}

// -------------------- StreamProxy --------------------

StreamProxy::StreamProxy(QObject *parent)
    : QObject(parent), port_(DEFAULT_SERVER_PORT), defaultModel_(QStringLiteral(DEFAULT_MODEL))
{
    qRegisterMetaType<StreamEvent>("StreamEvent");
    qRegisterMetaType<StreamResult>("StreamResult");
    nam_ = new QNetworkAccessManager(this);
    nam_->setProxy(QNetworkProxy::NoProxy);
}

StreamProxy::~StreamProxy() = default;

void StreamProxy::setPort(int port)
{
    port_ = port;
}

void StreamProxy::setDefaultModel(const QString &model)
{
    defaultModel_ = model;
}

QNetworkRequest StreamProxy::buildRequest(const QUrl &url, int bodySize) const
{
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setHeader(QNetworkRequest::ContentLengthHeader, bodySize);
    req.setRawHeader("Accept", "text/event-stream");
    req.setRawHeader("Cache-Control", "no-cache");
    req.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    req.setTransferTimeout(0); // the stream may legitimately idle while tools run
    return req;
}

StreamSession *StreamProxy::streamChat(const ChatRequest &request)
{
    const quint64 id = ++nextSessionId_;
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral(DEFAULT_SERVER_HOST));
    url.setPort(port_);
    url.setPath(QStringLiteral(CHAT_STREAM_ENDPOINT));

    const QByteArray body = request.toJsonBody(defaultModel_);
    FlowTracer::log(FlowChannel::Net, QStringLiteral("net: POST %1 history=%2 message=%3")
                                          .arg(url.toString())
                                          .arg(request.history.size())
                                          .arg(preview(request.message, 50)),
                    id);
    QNetworkReply *reply = nam_->post(buildRequest(url, body.size()), body);
    return new StreamSession(id, reply, this);
}
