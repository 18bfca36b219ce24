#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "planner/ui/cli/CommandLineFrontend.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Training Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    planner::ui::CommandLineFrontend frontend(out, err);
    return frontend.run(QCoreApplication::arguments());
}
