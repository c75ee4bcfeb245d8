#ifndef MSC_ERROR_H
#define MSC_ERROR_H

#include <QString>

// 统一错误码：
// - 状态文案可读，日志/自动化可以稳定匹配错误类别。
// - 约定：
//   - BE = backend process lifecycle (spawn, crash)
//   - HC = health probe
//   - NET = streamed chat request
enum class MscErrorCode
{
    None = 0,
    BeScriptMissing,
    BeSpawnFailed,
    BeCrashed,
    BeExitedBeforeReady,
    HcUnreachable,
    HcTimeout,
    HcBadStatus,
    NetHttpStatus,
    NetSocketError,
};

inline QString mscErrorCodeTag(MscErrorCode code)
{
    switch (code)
    {
    case MscErrorCode::BeScriptMissing: return QStringLiteral("MSC-BE-001");
    case MscErrorCode::BeSpawnFailed: return QStringLiteral("MSC-BE-002");
    case MscErrorCode::BeCrashed: return QStringLiteral("MSC-BE-003");
    case MscErrorCode::BeExitedBeforeReady: return QStringLiteral("MSC-BE-004");
    case MscErrorCode::HcUnreachable: return QStringLiteral("MSC-HC-001");
    case MscErrorCode::HcTimeout: return QStringLiteral("MSC-HC-002");
    case MscErrorCode::HcBadStatus: return QStringLiteral("MSC-HC-003");
    case MscErrorCode::NetHttpStatus: return QStringLiteral("MSC-NET-001");
    case MscErrorCode::NetSocketError: return QStringLiteral("MSC-NET-002");
    case MscErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("MSC-UNKNOWN");
}

inline QString formatMscError(MscErrorCode code, const QString &message)
{
    if (code == MscErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(mscErrorCodeTag(code), message);
}

#endif // MSC_ERROR_H
