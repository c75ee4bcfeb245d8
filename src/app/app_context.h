#pragma once

#include <QString>

#include "xconfig.h"

// 应用启动阶段需要的上下文信息（只读快照）。
// 约定：AppContext 在解析命令行后构建完成，后续仅作为只读配置传递。
struct AppContext
{
    QString appDir;       // 可执行程序所在目录
    QString appPath;      // 可执行程序完整路径
    QString configDir;    // 配置目录（--config，默认与可执行程序同目录）
    QString configPath;   // msconsole_config.ini 绝对路径
    QString resourcesDir; // 打包资源根目录（--resources）
    bool packaged = false;

    int port = DEFAULT_SERVER_PORT;
    QString interpreterOverride; // --interpreter
    QString scriptOverride;      // --script
};
