#include "service/net/stream_event.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace
{
bool requireString(const QJsonObject &obj, const QString &key, QString *out, QString *error)
{
    const QJsonValue v = obj.value(key);
    if (!v.isString())
    {
        if (error) *error = QStringLiteral("missing string field '%1'").arg(key);
        return false;
    }
    *out = v.toString();
    return true;
}

// tool results are usually text, but the backend may hand back structured data
QString valueAsText(const QJsonValue &v)
{
    if (v.isString()) return v.toString();
    if (v.isObject()) return QString::fromUtf8(QJsonDocument(v.toObject()).toJson(QJsonDocument::Compact));
    if (v.isArray()) return QString::fromUtf8(QJsonDocument(v.toArray()).toJson(QJsonDocument::Compact));
    if (v.isDouble()) return QString::number(v.toDouble());
    if (v.isBool()) return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    return QString();
}

struct JsonVisitor
{
    QJsonObject operator()(const TokenEvent &e) const
    {
        return {{QStringLiteral("type"), QStringLiteral("token")}, {QStringLiteral("content"), e.content}};
    }
    QJsonObject operator()(const ToolCallStartEvent &e) const
    {
        return {{QStringLiteral("type"), QStringLiteral("tool_call_start")},
                {QStringLiteral("tool_id"), e.toolId},
                {QStringLiteral("tool_name"), e.toolName},
                {QStringLiteral("arguments"), e.arguments}};
    }
    QJsonObject operator()(const ToolCallEndEvent &e) const
    {
        return {{QStringLiteral("type"), QStringLiteral("tool_call_end")},
                {QStringLiteral("tool_id"), e.toolId},
                {QStringLiteral("result"), e.result}};
    }
    QJsonObject operator()(const DoneEvent &e) const
    {
        return {{QStringLiteral("type"), QStringLiteral("done")}, {QStringLiteral("content"), e.content}};
    }
    QJsonObject operator()(const ErrorEvent &e) const
    {
        return {{QStringLiteral("type"), QStringLiteral("error")}, {QStringLiteral("message"), e.message}};
    }
};
} // namespace

QString streamEventKindName(StreamEvent::Kind kind)
{
    switch (kind)
    {
    case StreamEvent::Kind::Token: return QStringLiteral("token");
    case StreamEvent::Kind::ToolCallStart: return QStringLiteral("tool_call_start");
    case StreamEvent::Kind::ToolCallEnd: return QStringLiteral("tool_call_end");
    case StreamEvent::Kind::Done: return QStringLiteral("done");
    case StreamEvent::Kind::Error: return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

QJsonObject StreamEvent::toJson() const
{
    return std::visit(JsonVisitor{}, payload_);
}

bool StreamEvent::operator==(const StreamEvent &other) const
{
    return toJson() == other.toJson();
}

bool parseStreamEvent(const QByteArray &payload, StreamEvent *out, QString *error)
{
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &perr);
    if (perr.error != QJsonParseError::NoError)
    {
        if (error) *error = perr.errorString();
        return false;
    }
    if (!doc.isObject())
    {
        if (error) *error = QStringLiteral("frame is not a JSON object");
        return false;
    }

    const QJsonObject obj = doc.object();
    const QString type = obj.value(QStringLiteral("type")).toString();
    if (type == QLatin1String("token"))
    {
        TokenEvent e;
        if (!requireString(obj, QStringLiteral("content"), &e.content, error)) return false;
        if (out) *out = StreamEvent(std::move(e));
        return true;
    }
    if (type == QLatin1String("tool_call_start"))
    {
        ToolCallStartEvent e;
        if (!requireString(obj, QStringLiteral("tool_id"), &e.toolId, error)) return false;
        if (!requireString(obj, QStringLiteral("tool_name"), &e.toolName, error)) return false;
        if (!obj.contains(QStringLiteral("arguments")))
        {
            if (error) *error = QStringLiteral("missing field 'arguments'");
            return false;
        }
        e.arguments = obj.value(QStringLiteral("arguments"));
        if (out) *out = StreamEvent(std::move(e));
        return true;
    }
    if (type == QLatin1String("tool_call_end"))
    {
        ToolCallEndEvent e;
        if (!requireString(obj, QStringLiteral("tool_id"), &e.toolId, error)) return false;
        if (!obj.contains(QStringLiteral("result")))
        {
            if (error) *error = QStringLiteral("missing field 'result'");
            return false;
        }
        e.result = valueAsText(obj.value(QStringLiteral("result")));
        if (out) *out = StreamEvent(std::move(e));
        return true;
    }
    if (type == QLatin1String("done"))
    {
        DoneEvent e;
        if (!requireString(obj, QStringLiteral("content"), &e.content, error)) return false;
        if (out) *out = StreamEvent(std::move(e));
        return true;
    }
    if (type == QLatin1String("error"))
    {
        ErrorEvent e;
        if (!requireString(obj, QStringLiteral("message"), &e.message, error)) return false;
        if (out) *out = StreamEvent(std::move(e));
        return true;
    }

    if (error) *error = type.isEmpty() ? QStringLiteral("missing field 'type'") : QStringLiteral("unknown event type '%1'").arg(type);
    return false;
}
