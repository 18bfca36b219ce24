#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "planner/core/AppSettings.hpp"

using namespace planner;

class AppSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void providesDefaults();
    void persistsValues();
    void rejectsNonPositiveReminder();
};

void AppSettingsTest::providesDefaults()
{
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("planner.ini")), QSettings::IniFormat);
    const core::AppSettings appSettings(settings);

    const auto options = appSettings.icsExportOptions();
    QVERIFY(options.timeZoneId.isEmpty());
    QCOMPARE(options.sessionTitle, QStringLiteral("Entrenamiento"));
    QCOMPARE(options.reminderMinutes, 10);
    QCOMPARE(appSettings.historyLimit(), static_cast<std::size_t>(100));
    QVERIFY(appSettings.lastProgramPath().isEmpty());
}

void AppSettingsTest::persistsValues()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("planner.ini"));
    {
        QSettings settings(path, QSettings::IniFormat);
        core::AppSettings appSettings(settings);
        data::IcsExportOptions options;
        options.timeZoneId = QStringLiteral("America/Bogota");
        options.sessionTitle = QStringLiteral("Natación");
        options.reminderMinutes = 15;
        appSettings.setIcsExportOptions(options);
        appSettings.setHistoryLimit(20);
        appSettings.setLastProgramPath(QStringLiteral("/tmp/plan.json"));
    }

    QSettings settings(path, QSettings::IniFormat);
    const core::AppSettings appSettings(settings);
    const auto options = appSettings.icsExportOptions();
    QCOMPARE(options.timeZoneId, QStringLiteral("America/Bogota"));
    QCOMPARE(options.sessionTitle, QStringLiteral("Natación"));
    QCOMPARE(options.reminderMinutes, 15);
    QCOMPARE(appSettings.historyLimit(), static_cast<std::size_t>(20));
    QCOMPARE(appSettings.lastProgramPath(), QStringLiteral("/tmp/plan.json"));
}

void AppSettingsTest::rejectsNonPositiveReminder()
{
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("planner.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("export/reminderMinutes"), 0);
    settings.setValue(QStringLiteral("session/historyLimit"), -5);

    const core::AppSettings appSettings(settings);
    QCOMPARE(appSettings.icsExportOptions().reminderMinutes, 10);
    QCOMPARE(appSettings.historyLimit(), static_cast<std::size_t>(1));
}

QTEST_GUILESS_MAIN(AppSettingsTest)
#include "AppSettingsTest.moc"
