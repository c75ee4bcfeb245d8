#pragma once

#include <QString>

#include "app_context.h"

class QCommandLineParser;

// 应用启动装配器：集中处理命令行、目录准备与默认配置。
class AppBootstrap
{
public:
    // 注册命令行选项（在 parser.process() 之前调用）。
    static void addOptions(QCommandLineParser &parser);

    // 构建 AppContext（路径与后端启动覆盖项）。
    static AppContext buildContext(const QCommandLineParser &parser);

    // 确保配置目录存在。
    static void ensureConfigDir(const AppContext &ctx);

    // 若无配置文件，则写入默认配置。
    static void ensureDefaultConfig(const AppContext &ctx);
};
