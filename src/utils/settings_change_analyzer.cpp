#include "utils/settings_change_analyzer.h"

namespace
{
void appendUniqueIfChanged(bool changed, const QString &tag, QStringList *out)
{
    if (!changed || !out) return;
    const QString normalized = tag.trimmed();
    if (normalized.isEmpty()) return;
    if (!out->contains(normalized)) out->append(normalized);
}

bool isTrimmedEqual(const QString &lhs, const QString &rhs)
{
    return lhs.trimmed() == rhs.trimmed();
}
} // namespace

SettingsChangeSummary analyzeSettingsChanges(const ConsoleSettings &beforeSettings,
                                            const ConsoleSettings &afterSettings)
{
    SettingsChangeSummary summary;

    // 1) 后端环境变量对应的字段（与 buildBackendEnvironment 保持一致）
    appendUniqueIfChanged(beforeSettings.openaiApiKey != afterSettings.openaiApiKey, QStringLiteral("openaiApiKey"), &summary.restartItems);
    appendUniqueIfChanged(!isTrimmedEqual(beforeSettings.model, afterSettings.model), QStringLiteral("model"), &summary.restartItems);
    appendUniqueIfChanged(!isTrimmedEqual(beforeSettings.mysqlHost, afterSettings.mysqlHost), QStringLiteral("mysqlHost"), &summary.restartItems);
    appendUniqueIfChanged(!isTrimmedEqual(beforeSettings.mysqlPort, afterSettings.mysqlPort), QStringLiteral("mysqlPort"), &summary.restartItems);
    appendUniqueIfChanged(beforeSettings.mysqlUsername != afterSettings.mysqlUsername, QStringLiteral("mysqlUsername"), &summary.restartItems);
    appendUniqueIfChanged(beforeSettings.mysqlPassword != afterSettings.mysqlPassword, QStringLiteral("mysqlPassword"), &summary.restartItems);
    appendUniqueIfChanged(beforeSettings.mysqlDatabase != afterSettings.mysqlDatabase, QStringLiteral("mysqlDatabase"), &summary.restartItems);
    summary.requiresBackendRestart = !summary.restartItems.isEmpty();

    // 2) 仅界面开关
    appendUniqueIfChanged(beforeSettings.showToolCalls != afterSettings.showToolCalls, QStringLiteral("showToolCalls"), &summary.uiItems);
    appendUniqueIfChanged(beforeSettings.streamTokens != afterSettings.streamTokens, QStringLiteral("streamTokens"), &summary.uiItems);

    summary.hasAnyChange = summary.requiresBackendRestart || !summary.uiItems.isEmpty();
    return summary;
}

QString compactChangeItems(const QStringList &items, int maxItems)
{
    QStringList normalized;
    for (const QString &item : items)
    {
        const QString trimmed = item.trimmed();
        if (trimmed.isEmpty()) continue;
        if (!normalized.contains(trimmed)) normalized.append(trimmed);
    }
    if (normalized.isEmpty()) return QStringLiteral("none");

    const int safeMax = qMax(1, maxItems);
    if (normalized.size() <= safeMax) return normalized.join(QStringLiteral(", "));

    const QStringList prefix = normalized.mid(0, safeMax);
    return QStringLiteral("%1 +%2").arg(prefix.join(QStringLiteral(", "))).arg(normalized.size() - safeMax);
}
