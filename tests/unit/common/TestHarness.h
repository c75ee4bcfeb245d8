#pragma once

#include <QCoreApplication>
#include <QFile>
#include <QString>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QtTest/QTest>

namespace msc::test
{

inline QCoreApplication *ensureQtApp()
{
    // QNetworkAccessManager / QProcess / QTimer 都需要事件循环；
    // 静态 app 保证在所有用例结束后才析构。
    static int argc = 1;
    static char arg0[] = "msconsole_tests";
    static char *argv[] = {arg0, nullptr};
    static QCoreApplication app(argc, argv);
    return &app;
}

// Spin the event loop until pred() holds or the timeout expires.
template <typename Pred>
bool waitUntil(Pred pred, int timeoutMs)
{
    return QTest::qWaitFor(pred, timeoutMs);
}

// A loopback port nobody listens on (bound once, then released).
inline int closedLoopbackPort()
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, 0)) return 0;
    const int port = probe.serverPort();
    probe.close();
    return port;
}

// Write a /bin/sh script into dir and return its absolute path.
inline QString writeShellScript(QTemporaryDir &dir, const QString &name, const QByteArray &body)
{
    const QString path = dir.filePath(name);
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return QString();
    f.write("#!/bin/sh\n");
    f.write(body);
    f.write("\n");
    f.close();
    f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

} // namespace msc::test
