#ifndef CONFIG_STORE_H
#define CONFIG_STORE_H

#include "xconfig.h"

#include <QString>
#include <QStringList>
#include <QVariant>

// Flat INI store for ConsoleSettings (QSettings, IniFormat).
// Values missing from the file fall back to ConsoleSettings defaults.
class ConfigStore
{
  public:
    explicit ConfigStore(const QString &filePath);

    QString filePath() const { return filePath_; }

    ConsoleSettings load() const;
    bool save(const ConsoleSettings &settings);

    // Single-key access using the persisted key names (openaiApiKey, model, ...).
    QVariant value(const QString &key) const;
    bool setValue(const QString &key, const QVariant &value);

    static QStringList keys();
    // Keys whose change requires the backend to be restarted.
    static QStringList connectionKeys();
    static bool isConnectionKey(const QString &key);
    // Connection keys never logged in full (everything except model and mysqlPort).
    static bool isSensitiveKey(const QString &key);

  private:
    QString filePath_;
};

#endif // CONFIG_STORE_H
