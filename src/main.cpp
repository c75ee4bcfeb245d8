#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include "app/app_bootstrap.h"
#include "app/console_controller.h"
#include "app/console_sink.h"
#include "service/backend/backend_launch.h"
#include "utils/flowtracer.h"

int main(int argc, char *argv[])
{
    QElapsedTimer startup;
    startup.start();

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("msconsole"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local control plane for the MS Console Python backend."));
    parser.addHelpOption();
    parser.addVersionOption();
    AppBootstrap::addOptions(parser);
    parser.process(app);

    const AppContext ctx = AppBootstrap::buildContext(parser);
    AppBootstrap::ensureConfigDir(ctx);
    AppBootstrap::ensureDefaultConfig(ctx);
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("config: %1").arg(QDir::toNativeSeparators(ctx.configPath)));

    BackendLaunchInput launchInput;
    launchInput.appDir = ctx.appDir;
    launchInput.resourcesDir = ctx.resourcesDir;
    launchInput.packaged = ctx.packaged;
    launchInput.interpreterOverride = ctx.interpreterOverride;
    launchInput.scriptOverride = ctx.scriptOverride;

    ConsoleController controller(ctx.configPath);
    controller.setPort(ctx.port);
    controller.setLaunchSpec(resolveBackendLaunch(launchInput));

    const ConsoleSettings settings = controller.settings();
    ConsoleSink sink;
    sink.setShowToolCalls(settings.showToolCalls);
    sink.setStreamTokens(settings.streamTokens);

    QObject::connect(&controller, &ConsoleController::backendStateChanged, &sink, &ConsoleSink::onBackendState);
    QObject::connect(&controller, &ConsoleController::backendStartFinished, &sink, &ConsoleSink::onStartFinished);
    QObject::connect(&controller, &ConsoleController::backendCrashed, &sink, &ConsoleSink::onBackendCrashed);
    QObject::connect(&controller, &ConsoleController::statusReady, &sink, &ConsoleSink::onStatus);
    QObject::connect(&controller, &ConsoleController::chatEvent, &sink, &ConsoleSink::onChatEvent);
    QObject::connect(&controller, &ConsoleController::chatFinished, &sink, &ConsoleSink::onChatFinished);
    QObject::connect(&controller, &ConsoleController::connectionTestFinished, &sink, &ConsoleSink::onConnectionTest);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller, &ConsoleController::stopBackend);

    // 一次性命令：后端启动结果出来后执行，然后退出
    const bool wantStatus = parser.isSet(QStringLiteral("status"));
    const bool wantTest = parser.isSet(QStringLiteral("test-connection"));
    const QString message = parser.value(QStringLiteral("message"));
    const QString model = parser.value(QStringLiteral("model"));

    if (wantStatus)
    {
        QObject::connect(&controller, &ConsoleController::statusReady, &app, [](const BackendStatus &status)
                         { QCoreApplication::exit(status.status == QLatin1String("running") ? 0 : 1); });
    }
    else if (wantTest)
    {
        QObject::connect(&controller, &ConsoleController::connectionTestFinished, &app, [](const ConnectionTestResult &result)
                         { QCoreApplication::exit(result.success ? 0 : 1); });
    }
    else if (!message.isEmpty())
    {
        QObject::connect(&controller, &ConsoleController::chatFinished, &app, [](quint64, const StreamResult &result)
                         { QCoreApplication::exit(result.success ? 0 : 1); });
    }

    bool commandIssued = false;
    QObject::connect(&controller, &ConsoleController::backendStartFinished, &app, [&](const BackendStartResult &result)
                     {
                         FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("startup: backend %1 after %2 ms")
                                                                     .arg(backendStartOutcomeName(result.outcome))
                                                                     .arg(startup.elapsed()));
                         if (commandIssued) return;
                         commandIssued = true;
                         if (wantStatus)
                             controller.requestStatus();
                         else if (wantTest)
                             controller.testConnection();
                         else if (!message.isEmpty())
                             controller.streamChat(message, {}, model);
                     });

    // 启动后端不阻塞主流程：结果只影响日志与一次性命令
    QTimer::singleShot(0, &controller, &ConsoleController::startBackend);
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("startup: host ready in %1 ms").arg(startup.elapsed()));

    return app.exec();
}
