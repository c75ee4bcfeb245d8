// Launch resolution and environment for the backend server process
#ifndef BACKEND_LAUNCH_H
#define BACKEND_LAUNCH_H

#include "xconfig.h"

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

struct BackendLaunchSpec
{
    QString interpreter;    // program handed to QProcess (python3 / python)
    QString scriptPath;     // absolute path of the server script
    QStringList extraArgs;  // appended after the script
};

struct BackendLaunchInput
{
    QString appDir;        // directory of the running executable
    QString resourcesDir;  // packaged resources root
    bool packaged = false; // installed bundle vs. development tree
    QString interpreterOverride;
    QString scriptOverride;
};

BackendLaunchSpec resolveBackendLaunch(const BackendLaunchInput &input);

// System environment plus the connection settings the backend reads at startup.
QProcessEnvironment buildBackendEnvironment(const ConsoleSettings &settings,
                                            int port,
                                            const QProcessEnvironment &base = QProcessEnvironment::systemEnvironment());

// Names of the variables buildBackendEnvironment() exports, in export order.
QStringList backendEnvironmentKeys();

// One-line launch summary safe for logs: credentials and database identity
// are reported as configured yes/no.
QString describeBackendEnvironment(const ConsoleSettings &settings, int port);

#endif // BACKEND_LAUNCH_H
