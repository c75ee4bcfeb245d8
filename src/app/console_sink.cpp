#include "console_sink.h"

#include <QDebug>
#include <QJsonDocument>

#include <cstdio>

ConsoleSink::ConsoleSink(QObject *parent)
    : QObject(parent)
{
    if (!out_.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered))
    {
        qWarning() << "console sink: cannot open stdout";
    }
}

void ConsoleSink::write(const QJsonObject &line)
{
    QIODevice *target = device_ ? device_ : &out_;
    if (!target->isOpen()) return;
    target->write(QJsonDocument(line).toJson(QJsonDocument::Compact));
    target->write("\n");
    ++linesWritten_;
}

void ConsoleSink::onBackendState(BackendState state)
{
    write(QJsonObject{{QStringLiteral("kind"), QStringLiteral("backend_state")},
                      {QStringLiteral("state"), backendStateName(state)}});
}

void ConsoleSink::onStartFinished(const BackendStartResult &result)
{
    QJsonObject line{{QStringLiteral("kind"), QStringLiteral("backend_start")},
                     {QStringLiteral("outcome"), backendStartOutcomeName(result.outcome)},
                     {QStringLiteral("generation"), QString::number(result.generation)}};
    if (!result.reason.isEmpty()) line.insert(QStringLiteral("reason"), formatMscError(result.code, result.reason));
    write(line);
}

void ConsoleSink::onBackendCrashed(int exitCode, const QString &reason)
{
    write(QJsonObject{{QStringLiteral("kind"), QStringLiteral("backend_crashed")},
                      {QStringLiteral("exitCode"), exitCode},
                      {QStringLiteral("reason"), reason}});
}

void ConsoleSink::onStatus(const BackendStatus &status)
{
    write(QJsonObject{{QStringLiteral("kind"), QStringLiteral("status")},
                      {QStringLiteral("status"), status.status},
                      {QStringLiteral("message"), status.message},
                      {QStringLiteral("port"), status.port}});
}

void ConsoleSink::onChatEvent(quint64 sessionId, const StreamEvent &event)
{
    const StreamEvent::Kind kind = event.kind();
    if (!showToolCalls_ && (kind == StreamEvent::Kind::ToolCallStart || kind == StreamEvent::Kind::ToolCallEnd)) return;
    if (!streamTokens_ && kind == StreamEvent::Kind::Token)
    {
        if (const TokenEvent *token = event.as<TokenEvent>()) tokenBuffer_ += token->content;
        return;
    }
    flushTokens(sessionId);
    write(QJsonObject{{QStringLiteral("kind"), QStringLiteral("chat_event")},
                      {QStringLiteral("session"), QString::number(sessionId)},
                      {QStringLiteral("event"), event.toJson()}});
}

void ConsoleSink::flushTokens(quint64 sessionId)
{
    if (tokenBuffer_.isEmpty()) return;
    write(QJsonObject{{QStringLiteral("kind"), QStringLiteral("chat_event")},
                      {QStringLiteral("session"), QString::number(sessionId)},
                      {QStringLiteral("event"), StreamEvent(TokenEvent{tokenBuffer_}).toJson()}});
    tokenBuffer_.clear();
}

void ConsoleSink::onChatFinished(quint64 sessionId, const StreamResult &result)
{
    // a cancelled or broken stream still shows the text received so far
    flushTokens(sessionId);
    QJsonObject line{{QStringLiteral("kind"), QStringLiteral("chat_finished")},
                     {QStringLiteral("session"), QString::number(sessionId)},
                     {QStringLiteral("success"), result.success}};
    if (result.cancelled) line.insert(QStringLiteral("cancelled"), true);
    if (!result.error.isEmpty()) line.insert(QStringLiteral("error"), result.error);
    write(line);
}

void ConsoleSink::onConnectionTest(const ConnectionTestResult &result)
{
    QJsonObject line{{QStringLiteral("kind"), QStringLiteral("connection_test")},
                     {QStringLiteral("success"), result.success}};
    if (!result.results.isEmpty()) line.insert(QStringLiteral("results"), result.results);
    if (!result.error.isEmpty()) line.insert(QStringLiteral("error"), result.error);
    write(line);
}
