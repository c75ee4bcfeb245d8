#include "flowtracer.h"

#include <QDebug>

namespace
{
QString channelLabel(FlowChannel channel)
{
    switch (channel)
    {
    case FlowChannel::Lifecycle: return QStringLiteral("lifecycle");
    case FlowChannel::Backend: return QStringLiteral("backend");
    case FlowChannel::Health: return QStringLiteral("health");
    case FlowChannel::Net: return QStringLiteral("net");
    case FlowChannel::Settings: return QStringLiteral("settings");
    }
    return QStringLiteral("unknown");
}

QString composeLine(FlowChannel channel, const QString &message, quint64 sessionId)
{
    const QString channelPart = QStringLiteral("[flow][%1]").arg(channelLabel(channel));
    if (sessionId == 0) return QStringLiteral("%1 %2").arg(channelPart, message);
    return QStringLiteral("%1[s%2] %3").arg(channelPart, QString::number(sessionId), message);
}
} // namespace

void FlowTracer::log(FlowChannel channel, const QString &message, quint64 sessionId)
{
    qInfo().noquote() << composeLine(channel, message, sessionId);
}

void FlowTracer::warn(FlowChannel channel, const QString &message, quint64 sessionId)
{
    qWarning().noquote() << composeLine(channel, message, sessionId);
}

QString maskSecret(const QString &secret)
{
    if (secret.isEmpty()) return QStringLiteral("(empty)");
    // 短密钥整体隐藏，避免前缀就是全部内容
    if (secret.size() <= 8) return QStringLiteral("****(len=%1)").arg(secret.size());
    return QStringLiteral("%1...(len=%2)").arg(secret.left(4)).arg(secret.size());
}
