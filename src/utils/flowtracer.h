#ifndef FLOWTRACER_H
#define FLOWTRACER_H

#include <QString>
#include <QtGlobal>

enum class FlowChannel
{
    Lifecycle,
    Backend,
    Health,
    Net,
    Settings
};

class FlowTracer
{
  public:
    // Print a unified flow log with channel and optional stream session id.
    static void log(FlowChannel channel, const QString &message, quint64 sessionId = 0);
    // Same line through qWarning, for failures.
    static void warn(FlowChannel channel, const QString &message, quint64 sessionId = 0);
};

// Masked form of a credential for logs: first 4 chars + length; never the full value.
QString maskSecret(const QString &secret);

#endif // FLOWTRACER_H
