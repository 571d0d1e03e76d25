// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <KAboutData>
#include <KLocalizedString>
#include <signal.h>

using namespace DisplaySwitch;

void signalHandler(int /*signal*/)
{
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("displayswitch");

    KAboutData aboutData(QStringLiteral("displayswitch"), i18n("Display Switch"), QStringLiteral("1.0.0"),
                         i18n("Pick a multi-monitor layout and follow display hotplug"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption listenOption(QStringList{QStringLiteral("l"), QStringLiteral("listen")},
                                    i18n("Listen for display hotplug events instead of prompting once"));
    parser.addOption(listenOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    Daemon daemon;

    if (!parser.isSet(listenOption)) {
        const CycleResult result = daemon.runOnce();
        return result.error == ErrorKind::QueryError ? 1 : 0;
    }

    // Set up signal handling for clean shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGHUP, signalHandler);

    if (!daemon.startListening()) {
        qCCritical(DisplaySwitch::lcDaemon) << "Failed to start hotplug listener";
        return 1;
    }

    qCInfo(DisplaySwitch::lcDaemon) << "Listening for display changes";
    const int result = app.exec();

    daemon.stop();
    return result;
}
