#include "service/backend/backend_launch.h"

#include "utils/flowtracer.h"

#include <QDir>

namespace
{
QString orDefault(const QString &value, const QString &fallback)
{
    const QString trimmed = value.trimmed();
    return trimmed.isEmpty() ? fallback : trimmed;
}

QString configuredFlag(const QString &value)
{
    return value.trimmed().isEmpty() ? QStringLiteral("no") : QStringLiteral("yes");
}
} // namespace

BackendLaunchSpec resolveBackendLaunch(const BackendLaunchInput &input)
{
    BackendLaunchSpec spec;
    spec.interpreter = orDefault(input.interpreterOverride, QStringLiteral(DEFAULT_PYTHON));

    if (!input.scriptOverride.trimmed().isEmpty())
    {
        spec.scriptPath = QDir::cleanPath(QDir(input.appDir).absoluteFilePath(input.scriptOverride.trimmed()));
    }
    else if (input.packaged)
    {
        spec.scriptPath = QDir::cleanPath(QDir(input.resourcesDir).filePath(QStringLiteral("python/" DEFAULT_SERVER_SCRIPT)));
    }
    else
    {
        // development tree: <repo>/build/<config>/msconsole -> <repo>/python
        spec.scriptPath = QDir::cleanPath(QDir(input.appDir).filePath(QStringLiteral("../../python/" DEFAULT_SERVER_SCRIPT)));
    }
    return spec;
}

QStringList backendEnvironmentKeys()
{
    return {QStringLiteral("OPENAI_API_KEY"),
            QStringLiteral("OPENAI_MODEL"),
            QStringLiteral("MYSQL_HOST"),
            QStringLiteral("MYSQL_PORT"),
            QStringLiteral("MYSQL_USERNAME"),
            QStringLiteral("MYSQL_PASSWORD"),
            QStringLiteral("MYSQL_DATABASE"),
            QStringLiteral("SERVER_PORT")};
}

QProcessEnvironment buildBackendEnvironment(const ConsoleSettings &settings, int port, const QProcessEnvironment &base)
{
    QProcessEnvironment env = base;
    env.insert(QStringLiteral("OPENAI_API_KEY"), settings.openaiApiKey);
    env.insert(QStringLiteral("OPENAI_MODEL"), orDefault(settings.model, QStringLiteral(DEFAULT_MODEL)));
    env.insert(QStringLiteral("MYSQL_HOST"), settings.mysqlHost);
    env.insert(QStringLiteral("MYSQL_PORT"), orDefault(settings.mysqlPort, QStringLiteral(DEFAULT_MYSQL_PORT)));
    env.insert(QStringLiteral("MYSQL_USERNAME"), settings.mysqlUsername);
    env.insert(QStringLiteral("MYSQL_PASSWORD"), settings.mysqlPassword);
    env.insert(QStringLiteral("MYSQL_DATABASE"), settings.mysqlDatabase);
    env.insert(QStringLiteral("SERVER_PORT"), QString::number(port));
    // stdout of a piped python is block-buffered; readiness markers must arrive promptly
    env.insert(QStringLiteral("PYTHONUNBUFFERED"), QStringLiteral("1"));
    return env;
}

QString describeBackendEnvironment(const ConsoleSettings &settings, int port)
{
    // credentials and database identity only as configured yes/no
    return QStringLiteral("port=%1 model=%2 apiKey=%3 dbHost=%4 dbPort=%5 dbUser=%6 dbPassword=%7 dbName=%8")
        .arg(QString::number(port),
             orDefault(settings.model, QStringLiteral(DEFAULT_MODEL)),
             configuredFlag(settings.openaiApiKey),
             configuredFlag(settings.mysqlHost),
             orDefault(settings.mysqlPort, QStringLiteral(DEFAULT_MYSQL_PORT)),
             configuredFlag(settings.mysqlUsername),
             configuredFlag(settings.mysqlPassword),
             configuredFlag(settings.mysqlDatabase));
}
