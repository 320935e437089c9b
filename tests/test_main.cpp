#include <cstdlib>
#include <iostream>

#include <catch2/catch_session.hpp>

#include <QCoreApplication>
#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>

#include "logging.h"

using namespace std;

// Shared by all the test executables. Qt needs an application object for
// settings, processes and timers, and the tests must not touch the user's
// real settings or model directory.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("The Last Viking LTD");
    QCoreApplication::setApplicationName("QVoiceScribe-tests");
    QStandardPaths::setTestModeEnabled(true);

    QTemporaryDir settings_dir;
    QSettings::setDefaultFormat(QSettings::IniFormat);
    QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, settings_dir.path());

    // QVS_TEST_LOGLEVEL=6 gives trace output on the console
    if (const char *level = getenv("QVS_TEST_LOGLEVEL")) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(atoi(level))));
    }

    return Catch::Session().run(argc, argv);
}
