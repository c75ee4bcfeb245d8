#include "storage/config_store.h"

#include "utils/flowtracer.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

namespace
{
QVariant defaultValue(const QString &key)
{
    const ConsoleSettings d;
    if (key == QLatin1String("openaiApiKey")) return d.openaiApiKey;
    if (key == QLatin1String("model")) return d.model;
    if (key == QLatin1String("mysqlHost")) return d.mysqlHost;
    if (key == QLatin1String("mysqlPort")) return d.mysqlPort;
    if (key == QLatin1String("mysqlUsername")) return d.mysqlUsername;
    if (key == QLatin1String("mysqlPassword")) return d.mysqlPassword;
    if (key == QLatin1String("mysqlDatabase")) return d.mysqlDatabase;
    if (key == QLatin1String("showToolCalls")) return d.showToolCalls;
    if (key == QLatin1String("streamTokens")) return d.streamTokens;
    return QVariant();
}
} // namespace

ConfigStore::ConfigStore(const QString &filePath)
    : filePath_(filePath)
{
}

QStringList ConfigStore::keys()
{
    return {QStringLiteral("openaiApiKey"),
            QStringLiteral("model"),
            QStringLiteral("mysqlHost"),
            QStringLiteral("mysqlPort"),
            QStringLiteral("mysqlUsername"),
            QStringLiteral("mysqlPassword"),
            QStringLiteral("mysqlDatabase"),
            QStringLiteral("showToolCalls"),
            QStringLiteral("streamTokens")};
}

QStringList ConfigStore::connectionKeys()
{
    return {QStringLiteral("openaiApiKey"),
            QStringLiteral("model"),
            QStringLiteral("mysqlHost"),
            QStringLiteral("mysqlPort"),
            QStringLiteral("mysqlUsername"),
            QStringLiteral("mysqlPassword"),
            QStringLiteral("mysqlDatabase")};
}

bool ConfigStore::isConnectionKey(const QString &key)
{
    return connectionKeys().contains(key);
}

bool ConfigStore::isSensitiveKey(const QString &key)
{
    return isConnectionKey(key) && key != QLatin1String("model") && key != QLatin1String("mysqlPort");
}

QVariant ConfigStore::value(const QString &key) const
{
    const QSettings settings(filePath_, QSettings::IniFormat);
    return settings.value(key, defaultValue(key));
}

bool ConfigStore::setValue(const QString &key, const QVariant &value)
{
    if (!keys().contains(key))
    {
        FlowTracer::warn(FlowChannel::Settings, QStringLiteral("settings: unknown key '%1' ignored").arg(key));
        return false;
    }
    QDir().mkpath(QFileInfo(filePath_).absolutePath());
    QSettings settings(filePath_, QSettings::IniFormat);
    settings.setValue(key, value);
    settings.sync();
    FlowTracer::log(FlowChannel::Settings, QStringLiteral("settings: %1 = %2")
                                               .arg(key, isSensitiveKey(key) ? maskSecret(value.toString()) : value.toString()));
    return settings.status() == QSettings::NoError;
}

ConsoleSettings ConfigStore::load() const
{
    const QSettings settings(filePath_, QSettings::IniFormat);
    const ConsoleSettings d;
    ConsoleSettings s;
    s.openaiApiKey = settings.value(QStringLiteral("openaiApiKey"), d.openaiApiKey).toString();
    s.model = settings.value(QStringLiteral("model"), d.model).toString();
    s.mysqlHost = settings.value(QStringLiteral("mysqlHost"), d.mysqlHost).toString();
    s.mysqlPort = settings.value(QStringLiteral("mysqlPort"), d.mysqlPort).toString();
    s.mysqlUsername = settings.value(QStringLiteral("mysqlUsername"), d.mysqlUsername).toString();
    s.mysqlPassword = settings.value(QStringLiteral("mysqlPassword"), d.mysqlPassword).toString();
    s.mysqlDatabase = settings.value(QStringLiteral("mysqlDatabase"), d.mysqlDatabase).toString();
    s.showToolCalls = settings.value(QStringLiteral("showToolCalls"), d.showToolCalls).toBool();
    s.streamTokens = settings.value(QStringLiteral("streamTokens"), d.streamTokens).toBool();
    return s;
}

bool ConfigStore::save(const ConsoleSettings &s)
{
    QDir().mkpath(QFileInfo(filePath_).absolutePath());
    QSettings settings(filePath_, QSettings::IniFormat);
    settings.setValue(QStringLiteral("openaiApiKey"), s.openaiApiKey);
    settings.setValue(QStringLiteral("model"), s.model);
    settings.setValue(QStringLiteral("mysqlHost"), s.mysqlHost);
    settings.setValue(QStringLiteral("mysqlPort"), s.mysqlPort);
    settings.setValue(QStringLiteral("mysqlUsername"), s.mysqlUsername);
    settings.setValue(QStringLiteral("mysqlPassword"), s.mysqlPassword);
    settings.setValue(QStringLiteral("mysqlDatabase"), s.mysqlDatabase);
    settings.setValue(QStringLiteral("showToolCalls"), s.showToolCalls);
    settings.setValue(QStringLiteral("streamTokens"), s.streamTokens);
    settings.sync();
    FlowTracer::log(FlowChannel::Settings, QStringLiteral("settings: saved to %1").arg(QDir::toNativeSeparators(filePath_)));
    return settings.status() == QSettings::NoError;
}
