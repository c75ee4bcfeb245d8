#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QSignalSpy>
#include <QTemporaryDir>

#include "../common/FakeBackendServer.h"
#include "../common/TestHarness.h"
#include "app/console_controller.h"
#include "service/net/request_registry.h"

using msc::test::ensureQtApp;
using msc::test::FakeBackendServer;
using msc::test::jsonRoute;
using msc::test::waitUntil;
using msc::test::writeShellScript;

namespace
{
SupervisorTimings fastTimings()
{
    SupervisorTimings t;
    t.graceWindowMs = 200;
    t.fallbackRetries = 1;
    t.fallbackDelayMs = 50;
    t.probeTimeoutMs = 300;
    t.restartDelayMs = 100;
    t.killGuardMs = 300;
    return t;
}

struct Fixture
{
    QTemporaryDir dir;
    FakeBackendServer server;
    ConsoleController controller;

    explicit Fixture(const QByteArray &script)
        : controller(dir.filePath(QStringLiteral("msconsole_config.ini")))
    {
        server.listen();
        BackendLaunchSpec spec;
        spec.interpreter = QStringLiteral("/bin/sh");
        spec.scriptPath = writeShellScript(dir, QStringLiteral("server.sh"), script);
        controller.setLaunchSpec(spec);
        controller.setPort(server.port());
        controller.setTimings(fastTimings());
    }
};

BackendStatus statusOf(const QSignalSpy &spy, int i)
{
    return spy.at(i).at(0).value<BackendStatus>();
}
} // namespace

TEST_CASE("status reports stopped without probing when no process is owned")
{
    ensureQtApp();
    Fixture f("exec sleep 30");
    REQUIRE(f.server.port() > 0);
    QSignalSpy spy(&f.controller, &ConsoleController::statusReady);

    f.controller.requestStatus();
    REQUIRE(spy.count() == 1);
    CHECK(statusOf(spy, 0).status == QStringLiteral("stopped"));
    CHECK(statusOf(spy, 0).message == QStringLiteral("Python backend not running"));
    CHECK(f.server.hits("/health") == 0);
    CHECK(f.controller.port() == f.server.port());
}

TEST_CASE("status of a ready backend is decided by one health probe")
{
    ensureQtApp();
    Fixture f("echo 'Server started'\nexec sleep 30");
    f.server.setRoute("GET", "/health", jsonRoute(200, "{\"status\":\"ok\"}"));
    QSignalSpy started(&f.controller, &ConsoleController::backendStartFinished);
    QSignalSpy spy(&f.controller, &ConsoleController::statusReady);

    f.controller.startBackend();
    REQUIRE(waitUntil([&]() { return started.count() == 1; }, 5000));
    f.controller.requestStatus();
    REQUIRE(waitUntil([&]() { return spy.count() == 1; }, 5000));
    CHECK(statusOf(spy, 0).status == QStringLiteral("running"));
    CHECK(statusOf(spy, 0).message == QStringLiteral("Backend is healthy"));
    CHECK(statusOf(spy, 0).port == f.server.port());
    CHECK(f.server.hits("/health") == 1);

    f.server.setRoute("GET", "/health", jsonRoute(500, "{}"));
    f.controller.requestStatus();
    REQUIRE(waitUntil([&]() { return spy.count() == 2; }, 5000));
    CHECK(statusOf(spy, 1).status == QStringLiteral("error"));
    CHECK(statusOf(spy, 1).message == QStringLiteral("Health check failed: 500"));
    CHECK(f.server.hits("/health") == 2);
}

TEST_CASE("a successful status probe promotes a degraded backend")
{
    ensureQtApp();
    Fixture f("exec sleep 30");
    f.server.setRoute("GET", "/health", jsonRoute(503, "{\"status\":\"loading\"}"));
    QSignalSpy started(&f.controller, &ConsoleController::backendStartFinished);
    QSignalSpy spy(&f.controller, &ConsoleController::statusReady);

    f.controller.startBackend();
    REQUIRE(waitUntil([&]() { return started.count() == 1; }, 5000));
    REQUIRE(f.controller.supervisor()->state() == BackendState::Degraded);

    f.controller.requestStatus();
    REQUIRE(waitUntil([&]() { return spy.count() == 1; }, 5000));
    CHECK(statusOf(spy, 0).status == QStringLiteral("degraded"));

    f.server.setRoute("GET", "/health", jsonRoute(200, "{\"status\":\"ok\"}"));
    f.controller.requestStatus();
    REQUIRE(waitUntil([&]() { return spy.count() == 2; }, 5000));
    CHECK(statusOf(spy, 1).status == QStringLiteral("running"));
    CHECK(f.controller.supervisor()->state() == BackendState::Ready);
}

TEST_CASE("changing a connection setting restarts a running backend, ui toggles do not")
{
    ensureQtApp();
    Fixture f("echo 'Server started'\nexec sleep 30");
    QSignalSpy started(&f.controller, &ConsoleController::backendStartFinished);
    f.controller.startBackend();
    REQUIRE(waitUntil([&]() { return started.count() == 1; }, 5000));

    CHECK(f.controller.setSetting(QStringLiteral("showToolCalls"), false));
    CHECK_FALSE(f.controller.supervisor()->isRestartPending());
    CHECK(f.controller.supervisor()->isRunning());

    // same value again: nothing to restart for
    CHECK(f.controller.setSetting(QStringLiteral("model"), QStringLiteral(DEFAULT_MODEL)));
    CHECK(f.controller.supervisor()->isRunning());

    CHECK(f.controller.setSetting(QStringLiteral("mysqlDatabase"), QStringLiteral("sales")));
    CHECK(f.controller.supervisor()->isRestartPending());
    REQUIRE(waitUntil([&]() { return started.count() == 2; }, 5000));
    CHECK(f.controller.setting(QStringLiteral("mysqlDatabase")).toString() == QStringLiteral("sales"));

    ConsoleSettings next = f.controller.settings();
    next.streamTokens = false;
    f.controller.applySettings(next);
    CHECK_FALSE(f.controller.supervisor()->isRestartPending());

    next.openaiApiKey = QStringLiteral("sk-rotated");
    f.controller.applySettings(next);
    CHECK(f.controller.supervisor()->isRestartPending());
    REQUIRE(waitUntil([&]() { return started.count() == 3; }, 5000));
    CHECK(f.controller.settings().openaiApiKey == QStringLiteral("sk-rotated"));
    f.controller.stopBackend();
}

TEST_CASE("applying corrected credentials brings a crashed backend back up")
{
    ensureQtApp();
    Fixture f("if [ \"$MYSQL_PASSWORD\" != \"good\" ]; then echo 'access denied' >&2; exit 3; fi\n"
              "echo 'Server started'\nexec sleep 30");
    QSignalSpy started(&f.controller, &ConsoleController::backendStartFinished);
    QSignalSpy states(&f.controller, &ConsoleController::backendStateChanged);

    f.controller.startBackend();
    REQUIRE(waitUntil([&]() { return f.controller.supervisor()->state() == BackendState::Crashed; }, 5000));
    REQUIRE(started.count() == 1);
    CHECK(started.at(0).at(0).value<BackendStartResult>().outcome == BackendStartResult::Outcome::Failed);
    CHECK_FALSE(f.controller.supervisor()->isRunning());

    states.clear();
    ConsoleSettings fixed = f.controller.settings();
    fixed.mysqlPassword = QStringLiteral("good");
    f.controller.applySettings(fixed);
    CHECK(f.controller.supervisor()->isRestartPending());

    REQUIRE(waitUntil([&]() { return started.count() == 2; }, 5000));
    CHECK(started.at(1).at(0).value<BackendStartResult>().outcome == BackendStartResult::Outcome::Ready);
    CHECK(f.controller.supervisor()->state() == BackendState::Ready);
    REQUIRE(states.count() == 2);
    CHECK(states.at(0).at(0).value<BackendState>() == BackendState::Starting);
    CHECK(states.at(1).at(0).value<BackendState>() == BackendState::Ready);
    f.controller.stopBackend();
}

TEST_CASE("applying connection settings starts a stopped backend, ui toggles do not")
{
    ensureQtApp();
    Fixture f("echo 'Server started'\nexec sleep 30");
    QSignalSpy started(&f.controller, &ConsoleController::backendStartFinished);

    ConsoleSettings next = f.controller.settings();
    next.showToolCalls = !next.showToolCalls;
    f.controller.applySettings(next);
    CHECK_FALSE(f.controller.supervisor()->isRestartPending());
    CHECK(f.controller.supervisor()->state() == BackendState::Stopped);

    next.mysqlHost = QStringLiteral("db.local");
    f.controller.applySettings(next);
    CHECK(f.controller.supervisor()->isRestartPending());
    REQUIRE(waitUntil([&]() { return started.count() == 1; }, 5000));
    CHECK(f.controller.supervisor()->state() == BackendState::Ready);
    f.controller.stopBackend();
}

TEST_CASE("a single setting saved while the backend is down only persists")
{
    ensureQtApp();
    Fixture f("exec sleep 30");
    CHECK(f.controller.setSetting(QStringLiteral("mysqlHost"), QStringLiteral("db.local")));
    CHECK_FALSE(f.controller.supervisor()->isRestartPending());
    CHECK(f.controller.supervisor()->state() == BackendState::Stopped);
    CHECK(f.controller.settings().mysqlHost == QStringLiteral("db.local"));
    CHECK_FALSE(f.controller.setSetting(QStringLiteral("unknownKey"), 1));
}

TEST_CASE("chat cancel with nothing in flight reports false")
{
    ensureQtApp();
    Fixture f("exec sleep 30");
    CHECK_FALSE(f.controller.cancelChat().cancelled);
}

TEST_CASE("chat through the controller uses the configured model")
{
    ensureQtApp();
    Fixture f("exec sleep 30");
    f.server.setRoute("POST", "/chat/stream",
                      msc::test::sseRoute({QByteArray("data: {\"type\":\"done\",\"content\":\"ok\"}\n\n")}));
    REQUIRE(f.controller.setSetting(QStringLiteral("model"), QStringLiteral("gpt-configured")));
    QSignalSpy finished(&f.controller, &ConsoleController::chatFinished);
    QSignalSpy events(&f.controller, &ConsoleController::chatEvent);

    const quint64 id = f.controller.streamChat(QStringLiteral("hi"), {});
    REQUIRE(waitUntil([&]() { return finished.count() == 1; }, 5000));
    CHECK(finished.at(0).at(0).toULongLong() == id);
    CHECK(finished.at(0).at(1).value<StreamResult>().success);
    CHECK(events.count() == 1);
    CHECK(f.server.lastBody("/chat/stream").contains("\"model\":\"gpt-configured\""));
}
