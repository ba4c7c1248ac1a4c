#include "matcher_service.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ghurfati-matcher"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    gf::MatcherService service;
    return service.run();
}
