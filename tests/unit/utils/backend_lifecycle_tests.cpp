#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "xconfig.h"

TEST_CASE("Backend state names are stable")
{
    CHECK(backendStateName(BackendState::Stopped) == QStringLiteral("stopped"));
    CHECK(backendStateName(BackendState::Starting) == QStringLiteral("starting"));
    CHECK(backendStateName(BackendState::Ready) == QStringLiteral("ready"));
    CHECK(backendStateName(BackendState::Degraded) == QStringLiteral("degraded"));
    CHECK(backendStateName(BackendState::Crashed) == QStringLiteral("crashed"));
}

TEST_CASE("Backend state machine allows expected transitions")
{
    CHECK(isBackendTransitionAllowed(BackendState::Stopped, BackendState::Starting));
    CHECK(isBackendTransitionAllowed(BackendState::Starting, BackendState::Ready));
    CHECK(isBackendTransitionAllowed(BackendState::Starting, BackendState::Degraded));
    CHECK(isBackendTransitionAllowed(BackendState::Starting, BackendState::Stopped));
    CHECK(isBackendTransitionAllowed(BackendState::Starting, BackendState::Crashed));
    CHECK(isBackendTransitionAllowed(BackendState::Ready, BackendState::Stopped));
    CHECK(isBackendTransitionAllowed(BackendState::Ready, BackendState::Crashed));
    CHECK(isBackendTransitionAllowed(BackendState::Degraded, BackendState::Ready));
    CHECK(isBackendTransitionAllowed(BackendState::Crashed, BackendState::Starting));
    CHECK(isBackendTransitionAllowed(BackendState::Crashed, BackendState::Stopped));
}

TEST_CASE("Backend state machine blocks invalid direct transitions")
{
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Stopped, BackendState::Ready));
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Stopped, BackendState::Crashed));
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Ready, BackendState::Starting));
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Ready, BackendState::Degraded));
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Crashed, BackendState::Ready));
    CHECK_FALSE(isBackendTransitionAllowed(BackendState::Degraded, BackendState::Starting));
}

TEST_CASE("Readiness markers differ per stream")
{
    const QStringList out = backendReadyMarkers(false);
    const QStringList err = backendReadyMarkers(true);
    CHECK(out.contains(QStringLiteral("Server started")));
    CHECK_FALSE(err.contains(QStringLiteral("Server started")));
    CHECK(err.contains(QStringLiteral("Started server")));
    CHECK_FALSE(out.contains(QStringLiteral("Started server")));
    CHECK(out.contains(QStringLiteral("Uvicorn running")));
    CHECK(err.contains(QStringLiteral("Application startup complete")));
}
