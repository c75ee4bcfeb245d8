#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QFile>
#include <QTemporaryDir>

#include "storage/config_store.h"

TEST_CASE("ConfigStore returns defaults when the file does not exist")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ConfigStore store(dir.filePath(QStringLiteral("msconsole_config.ini")));

    const ConsoleSettings s = store.load();
    CHECK(s.openaiApiKey.isEmpty());
    CHECK(s.model == QStringLiteral("gpt-5.2"));
    CHECK(s.mysqlPort == QStringLiteral("3306"));
    CHECK(s.mysqlHost.isEmpty());
    CHECK(s.mysqlPassword.isEmpty());
    CHECK(s.showToolCalls);
    CHECK(s.streamTokens);
    CHECK(store.value(QStringLiteral("model")).toString() == QStringLiteral("gpt-5.2"));
}

TEST_CASE("ConfigStore save/load round trip survives a new instance")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/msconsole_config.ini"));

    ConsoleSettings s;
    s.openaiApiKey = QStringLiteral("sk-abc");
    s.model = QStringLiteral("gpt-5.2-mini");
    s.mysqlHost = QStringLiteral("10.0.0.5");
    s.mysqlUsername = QStringLiteral("analyst");
    s.mysqlPassword = QStringLiteral("p@ss");
    s.mysqlDatabase = QStringLiteral("warehouse");
    s.showToolCalls = false;
    {
        ConfigStore store(path);
        REQUIRE(store.save(s));
    }
    CHECK(QFile::exists(path));

    ConfigStore reopened(path);
    const ConsoleSettings loaded = reopened.load();
    CHECK(loaded.openaiApiKey == s.openaiApiKey);
    CHECK(loaded.model == s.model);
    CHECK(loaded.mysqlHost == s.mysqlHost);
    CHECK(loaded.mysqlUsername == s.mysqlUsername);
    CHECK(loaded.mysqlPassword == s.mysqlPassword);
    CHECK(loaded.mysqlDatabase == s.mysqlDatabase);
    CHECK_FALSE(loaded.showToolCalls);
    CHECK(loaded.streamTokens);
}

TEST_CASE("ConfigStore setValue persists known keys and rejects unknown ones")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    ConfigStore store(dir.filePath(QStringLiteral("msconsole_config.ini")));

    CHECK(store.setValue(QStringLiteral("mysqlPort"), QStringLiteral("3310")));
    CHECK(store.load().mysqlPort == QStringLiteral("3310"));
    CHECK(store.setValue(QStringLiteral("streamTokens"), false));
    CHECK_FALSE(store.load().streamTokens);

    CHECK_FALSE(store.setValue(QStringLiteral("theme"), QStringLiteral("dark")));
    CHECK_FALSE(store.value(QStringLiteral("theme")).isValid());
}

TEST_CASE("connection keys are exactly the values the backend reads")
{
    const QStringList keys = ConfigStore::connectionKeys();
    CHECK(keys.size() == 7);
    CHECK(ConfigStore::isConnectionKey(QStringLiteral("openaiApiKey")));
    CHECK(ConfigStore::isConnectionKey(QStringLiteral("mysqlDatabase")));
    CHECK_FALSE(ConfigStore::isConnectionKey(QStringLiteral("showToolCalls")));
    CHECK_FALSE(ConfigStore::isConnectionKey(QStringLiteral("streamTokens")));
    for (const QString &k : keys) CHECK(ConfigStore::keys().contains(k));
}

TEST_CASE("database identity and credentials are sensitive, model and db port are not")
{
    for (const char *key : {"openaiApiKey", "mysqlHost", "mysqlUsername", "mysqlPassword", "mysqlDatabase"})
    {
        CAPTURE(key);
        CHECK(ConfigStore::isSensitiveKey(QString::fromLatin1(key)));
    }
    CHECK_FALSE(ConfigStore::isSensitiveKey(QStringLiteral("model")));
    CHECK_FALSE(ConfigStore::isSensitiveKey(QStringLiteral("mysqlPort")));
    CHECK_FALSE(ConfigStore::isSensitiveKey(QStringLiteral("showToolCalls")));
}
