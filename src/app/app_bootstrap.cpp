#include "app_bootstrap.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include "storage/config_store.h"
#include "utils/flowtracer.h"

void AppBootstrap::addOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(QStringLiteral("config"), QStringLiteral("Directory holding msconsole_config.ini."), QStringLiteral("dir")));
    parser.addOption(QCommandLineOption(QStringLiteral("port"), QStringLiteral("Backend port (default 8765)."), QStringLiteral("n"),
                                        QString::number(DEFAULT_SERVER_PORT)));
    parser.addOption(QCommandLineOption(QStringLiteral("interpreter"), QStringLiteral("Python interpreter to launch."), QStringLiteral("path")));
    parser.addOption(QCommandLineOption(QStringLiteral("script"), QStringLiteral("Backend server script."), QStringLiteral("path")));
    parser.addOption(QCommandLineOption(QStringLiteral("packaged"), QStringLiteral("Resolve the script from the resources directory.")));
    parser.addOption(QCommandLineOption(QStringLiteral("resources"), QStringLiteral("Packaged resources root."), QStringLiteral("dir")));
    parser.addOption(QCommandLineOption(QStringLiteral("message"), QStringLiteral("Send one chat message and print its events."), QStringLiteral("text")));
    parser.addOption(QCommandLineOption(QStringLiteral("model"), QStringLiteral("Model id for --message."), QStringLiteral("id")));
    parser.addOption(QCommandLineOption(QStringLiteral("test-connection"), QStringLiteral("Run the backend connection test and exit.")));
    parser.addOption(QCommandLineOption(QStringLiteral("status"), QStringLiteral("Print the backend status and exit.")));
}

AppContext AppBootstrap::buildContext(const QCommandLineParser &parser)
{
    AppContext ctx;
    ctx.appDir = QCoreApplication::applicationDirPath();
    ctx.appPath = QCoreApplication::applicationFilePath();

    ctx.configDir = parser.isSet(QStringLiteral("config")) ? QDir(parser.value(QStringLiteral("config"))).absolutePath() : ctx.appDir;
    ctx.configPath = QDir(ctx.configDir).filePath(QStringLiteral(DEFAULT_CONFIG_FILE));

    ctx.packaged = parser.isSet(QStringLiteral("packaged"));
    ctx.resourcesDir = parser.isSet(QStringLiteral("resources")) ? QDir(parser.value(QStringLiteral("resources"))).absolutePath()
                                                                 : QDir(ctx.appDir).filePath(QStringLiteral("resources"));

    bool ok = false;
    const int port = parser.value(QStringLiteral("port")).toInt(&ok);
    if (ok && port > 0 && port < 65536)
    {
        ctx.port = port;
    }
    else
    {
        FlowTracer::warn(FlowChannel::Lifecycle, QStringLiteral("invalid --port '%1', using %2")
                                                     .arg(parser.value(QStringLiteral("port")))
                                                     .arg(DEFAULT_SERVER_PORT));
    }

    ctx.interpreterOverride = parser.value(QStringLiteral("interpreter"));
    ctx.scriptOverride = parser.value(QStringLiteral("script"));
    return ctx;
}

void AppBootstrap::ensureConfigDir(const AppContext &ctx)
{
    QDir().mkpath(ctx.configDir);
}

void AppBootstrap::ensureDefaultConfig(const AppContext &ctx)
{
    if (QFileInfo::exists(ctx.configPath)) return;
    ConfigStore store(ctx.configPath);
    if (!store.save(ConsoleSettings()))
    {
        FlowTracer::warn(FlowChannel::Settings, QStringLiteral("cannot write default config %1").arg(QDir::toNativeSeparators(ctx.configPath)));
    }
}
