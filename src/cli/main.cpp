#include <QCoreApplication>

#include "cli/ScanCli.hpp"
#include "common/driftwatch_version.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("driftwatch"));
    QCoreApplication::setApplicationVersion(QStringLiteral(DRIFTWATCH_VERSION));

    // One scan per invocation; scheduling is the caller's job.
    driftwatch::ScanCli cli;
    return cli.run(argc, argv);
}
