#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "utils/settings_change_analyzer.h"

TEST_CASE("settings analyzer reports no change when snapshots are equal")
{
    ConsoleSettings before;
    ConsoleSettings after = before;
    const SettingsChangeSummary summary = analyzeSettingsChanges(before, after);
    CHECK_FALSE(summary.hasAnyChange);
    CHECK_FALSE(summary.requiresBackendRestart);
    CHECK(summary.restartItems.isEmpty());
    CHECK(summary.uiItems.isEmpty());
}

TEST_CASE("settings analyzer keeps ui toggles out of the restart list")
{
    ConsoleSettings before;
    ConsoleSettings after = before;
    after.showToolCalls = false;
    after.streamTokens = false;

    const SettingsChangeSummary summary = analyzeSettingsChanges(before, after);
    CHECK(summary.hasAnyChange);
    CHECK_FALSE(summary.requiresBackendRestart);
    CHECK(summary.restartItems.isEmpty());
    CHECK(summary.uiItems == QStringList({QStringLiteral("showToolCalls"), QStringLiteral("streamTokens")}));
}

TEST_CASE("settings analyzer marks every connection field for restart")
{
    ConsoleSettings before;
    ConsoleSettings after = before;
    after.openaiApiKey = QStringLiteral("sk-new");
    after.model = QStringLiteral("gpt-5.2-mini");
    after.mysqlHost = QStringLiteral("db.internal");
    after.mysqlPort = QStringLiteral("3307");
    after.mysqlUsername = QStringLiteral("reader");
    after.mysqlPassword = QStringLiteral("pw");
    after.mysqlDatabase = QStringLiteral("sales");

    const SettingsChangeSummary summary = analyzeSettingsChanges(before, after);
    CHECK(summary.hasAnyChange);
    CHECK(summary.requiresBackendRestart);
    CHECK(summary.restartItems.size() == 7);
    CHECK(summary.restartItems.contains(QStringLiteral("openaiApiKey")));
    CHECK(summary.restartItems.contains(QStringLiteral("mysqlDatabase")));
    CHECK(summary.uiItems.isEmpty());
}

TEST_CASE("settings analyzer ignores surrounding whitespace on host, port and model")
{
    ConsoleSettings before;
    before.mysqlHost = QStringLiteral("localhost");
    ConsoleSettings after = before;
    after.mysqlHost = QStringLiteral(" localhost ");
    after.model = QStringLiteral(DEFAULT_MODEL "  ");

    const SettingsChangeSummary summary = analyzeSettingsChanges(before, after);
    CHECK_FALSE(summary.hasAnyChange);
}

TEST_CASE("compactChangeItems deduplicates and truncates")
{
    CHECK(compactChangeItems({}) == QStringLiteral("none"));
    CHECK(compactChangeItems({QStringLiteral("model"), QStringLiteral(" model ")}) == QStringLiteral("model"));
    const QStringList many = {QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c"), QStringLiteral("d"), QStringLiteral("e")};
    CHECK(compactChangeItems(many, 3) == QStringLiteral("a, b, c +2"));
    CHECK(compactChangeItems(many, 0) == QStringLiteral("a +4"));
}
