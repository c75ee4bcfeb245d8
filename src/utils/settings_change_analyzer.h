#ifndef SETTINGS_CHANGE_ANALYZER_H
#define SETTINGS_CHANGE_ANALYZER_H

#include "xconfig.h"

#include <QString>
#include <QStringList>

// 设置变化分析结果：
// - restartItems：后端进程读取的连接项，变更后需要重启后端
// - uiItems：仅影响界面呈现的开关，无需重启
struct SettingsChangeSummary
{
    bool hasAnyChange = false;
    bool requiresBackendRestart = false;
    QStringList restartItems;
    QStringList uiItems;
};

SettingsChangeSummary analyzeSettingsChanges(const ConsoleSettings &beforeSettings,
                                            const ConsoleSettings &afterSettings);

// 将变化项压缩为短文本，避免日志过长。
QString compactChangeItems(const QStringList &items, int maxItems = 3);

#endif // SETTINGS_CHANGE_ANALYZER_H
