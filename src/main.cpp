#include <memory>
#include <iostream>

#include <QFileInfo>
#include <QGuiApplication>
#include <QIcon>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QSettings>

#include "AppEngine.h"
#include "logging.h"

using namespace std;

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    // Set application information
    QCoreApplication::setOrganizationName("The Last Viking LTD");
    QCoreApplication::setApplicationName("QVoiceScribe");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QSettings settings;

    AppEngine::initLogging();

    LOG_INFO << "Starting QVoiceScribe " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName() << "'";

    // Optional. We run fine without it.
    if (const QFileInfo icon{"icon.png"}; icon.isFile()) {
        app.setWindowIcon(QIcon{icon.absoluteFilePath()});
    } else {
        LOG_DEBUG << "No icon.png in " << QFileInfo{"."}.absoluteFilePath();
    }

    QQuickStyle::setStyle("Fusion");

    AppEngine app_engine;

    QQmlApplicationEngine qml_engine;
    qml_engine.rootContext()->setContextProperty("appEngine", &app_engine);

    QObject::connect(
        &qml_engine,
        &QQmlApplicationEngine::objectCreationFailed,
        &app,
        []() { QCoreApplication::exit(-1); },
        Qt::QueuedConnection);

    qml_engine.load(QUrl(QStringLiteral("qrc:/QVoiceScribe/qml/Main.qml")));

    return app.exec();
}
