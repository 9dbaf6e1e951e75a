// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#define TRANSLATION_DOMAIN "panesync"

#include "windowcontroller.h"
#include "../config/settings.h"
#include "../core/filestore.h"
#include "../core/layoutstore.h"
#include "../core/logging.h"
#include "../core/toastservice.h"
#include "../drag/chatattachments.h"
#include "../drag/dragregionarbiter.h"
#include "../drag/dragstate.h"
#include "version.h"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickWindow>

#include <KAboutData>
#include <KDBusService>
#include <KLocalizedContext>
#include <KLocalizedString>

using namespace PaneSync;

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("panesync");

    KAboutData aboutData(QStringLiteral("panesync-window"), i18n("PaneSync"), PaneSync::VERSION_STRING,
                         i18n("Editor window that stays in sync with its sibling windows"), KAboutLicense::GPL_V3,
                         i18n("(c) 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setOrganizationDomain(QByteArrayLiteral("panesync.org"));
    aboutData.setDesktopFileName(QStringLiteral("org.panesync.window"));
    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption labelOption(QStringLiteral("window-label"), i18n("Identity of this window on the event bus"),
                                   QStringLiteral("label"));
    QCommandLineOption projectOption(QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                     i18n("Project directory to open"), QStringLiteral("path"));
    QCommandLineOption noSyncOption(QStringLiteral("no-sync"), i18n("Do not synchronize with other windows"));

    parser.addOptions({labelOption, projectOption, noSyncOption});
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Every window is its own process: register a per-process bus name, keep running without a bus
    KDBusService service(KDBusService::Multiple | KDBusService::NoExitOnFailure);
    if (!service.isRegistered()) {
        qCWarning(lcApp) << "D-Bus service registration failed:" << service.errorMessage();
    }

    Settings settings;

    WindowOptions options;
    options.windowLabel = parser.value(labelOption);
    options.syncEnabled = !parser.isSet(noSyncOption);
    if (parser.isSet(projectOption)) {
        const QFileInfo projectInfo(parser.value(projectOption));
        if (!projectInfo.isDir()) {
            qCWarning(lcApp) << "Project path is not a directory:" << parser.value(projectOption);
        } else {
            options.projectPath = projectInfo.absoluteFilePath();
        }
    }

    WindowController controller(&settings, options);

    QQmlApplicationEngine engine;

    // Set up i18n for QML (this makes i18n() available in QML)
    KLocalizedContext* localizedContext = new KLocalizedContext(&engine);
    engine.rootContext()->setContextObject(localizedContext);

    engine.rootContext()->setContextProperty(QStringLiteral("windowController"), &controller);
    engine.rootContext()->setContextProperty(QStringLiteral("fileStore"), controller.fileStore());
    engine.rootContext()->setContextProperty(QStringLiteral("layoutStore"), controller.layoutStore());
    engine.rootContext()->setContextProperty(QStringLiteral("toastService"), controller.toastService());
    engine.rootContext()->setContextProperty(QStringLiteral("dragOverChat"), controller.dragOverChat());
    engine.rootContext()->setContextProperty(QStringLiteral("dragArbiter"), controller.dragArbiter());
    engine.rootContext()->setContextProperty(QStringLiteral("chatAttachments"), controller.chatAttachments());
    engine.rootContext()->setContextProperty(QStringLiteral("chatRegionMarker"), settings.chatRegionMarker());

    engine.loadFromModule("org.panesync.window", "Main");

    if (engine.rootObjects().isEmpty()) {
        qCCritical(lcApp) << "Failed to load Main.qml";
        return -1;
    }

    auto* window = qobject_cast<QQuickWindow*>(engine.rootObjects().constFirst());
    controller.attachWindow(window);
    controller.start();

    return app.exec();
}
