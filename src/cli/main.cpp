#include <QCoreApplication>

#include "cli/ProvisionCli.hpp"
#include "common/hostprep_version.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hostprep"));
    QCoreApplication::setApplicationVersion(QStringLiteral(HOSTPREP_VERSION));

    hostprep::ProvisionCli cli;
    return cli.run(argc, argv);
}
