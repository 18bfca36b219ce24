#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include "planner/core/ProgramSession.hpp"

using namespace planner;

class ProgramSessionTest : public QObject
{
    Q_OBJECT

private slots:
    void emitsOnlyOnChange();
    void outsidePinMovesBetweenDates();
    void explicitForceReleasesPin();
    void disablingWeekdayDropsSchedule();
    void undoRedoRestoresState();
    void rejectedEventLeavesNoHistory();
    void failedLoadKeepsState();
    void saveAppendsSuffix();
};

void ProgramSessionTest::emitsOnlyOnChange()
{
    core::ProgramSession session;
    QSignalSpy spy(&session, &core::ProgramSession::stateChanged);

    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 14));
    QCOMPARE(spy.count(), 1);
    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 14));
    QCOMPARE(spy.count(), 1);
    session.clearSchedule(Qt::Monday);
    QCOMPARE(spy.count(), 1);
    QVERIFY(session.canUndo());
    QVERIFY(session.undo());
    QVERIFY(!session.canUndo());
}

void ProgramSessionTest::outsidePinMovesBetweenDates()
{
    core::ProgramSession session;
    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 14));

    session.toggleOutsideSelection(QDate(2024, 1, 20));
    QCOMPARE(session.pinnedOutsideDate(), QDate(2024, 1, 20));
    QVERIFY(session.state().isForcedOn(QDate(2024, 1, 20)));

    session.toggleOutsideSelection(QDate(2024, 1, 22));
    QCOMPARE(session.pinnedOutsideDate(), QDate(2024, 1, 22));
    QVERIFY(!session.state().isForcedOn(QDate(2024, 1, 20)));
    QVERIFY(session.state().isForcedOn(QDate(2024, 1, 22)));

    session.toggleOutsideSelection(QDate(2024, 1, 22));
    QVERIFY(!session.pinnedOutsideDate().isValid());
    QVERIFY(session.state().forcedOnDates().isEmpty());
}

void ProgramSessionTest::explicitForceReleasesPin()
{
    core::ProgramSession session;
    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 14));
    session.toggleOutsideSelection(QDate(2024, 1, 20));
    session.forceOn(QDate(2024, 1, 20));
    QVERIFY(!session.pinnedOutsideDate().isValid());

    // The explicitly forced date survives the next outside pick.
    session.toggleOutsideSelection(QDate(2024, 1, 25));
    QVERIFY(session.state().isForcedOn(QDate(2024, 1, 20)));
    QVERIFY(session.state().isForcedOn(QDate(2024, 1, 25)));
    QCOMPARE(session.pinnedOutsideDate(), QDate(2024, 1, 25));
}

void ProgramSessionTest::disablingWeekdayDropsSchedule()
{
    core::ProgramSession session;
    session.setTrainingDay(Qt::Tuesday, true);
    session.setSchedule(Qt::Tuesday, data::TimeRange{QTime(7, 0), QTime(8, 0)});
    QVERIFY(session.state().scheduleFor(Qt::Tuesday).has_value());

    session.setTrainingDay(Qt::Tuesday, false);
    QVERIFY(!session.state().isTrainingDay(Qt::Tuesday));
    QVERIFY(!session.state().scheduleFor(Qt::Tuesday).has_value());

    QVERIFY(session.undo());
    QVERIFY(session.state().scheduleFor(Qt::Tuesday).has_value());
}

void ProgramSessionTest::undoRedoRestoresState()
{
    core::ProgramSession session;
    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 7));
    session.setTrainingDay(Qt::Monday, true);
    session.setSchedule(Qt::Monday, data::TimeRange{QTime(6, 0), QTime(7, 0)});
    const data::ProgramState full = session.state();

    QSignalSpy spy(&session, &core::ProgramSession::stateChanged);
    QVERIFY(session.undo());
    QVERIFY(session.undo());
    QVERIFY(!session.state().isTrainingDay(Qt::Monday));
    QCOMPARE(spy.count(), 2);

    QVERIFY(session.redo());
    QVERIFY(session.redo());
    QVERIFY(session.state() == full);
    QVERIFY(!session.redo());
    QCOMPARE(session.summary()->totalMinutes, 60);
}

void ProgramSessionTest::rejectedEventLeavesNoHistory()
{
    core::ProgramSession session;
    data::CalendarEvent blank;
    blank.title = QStringLiteral("   ");
    QVERIFY(!session.addEvent(QDate(2024, 1, 3), blank));
    QVERIFY(!session.canUndo());

    data::CalendarEvent event;
    event.title = QStringLiteral("Fisio");
    event.time = data::TimeRange{QTime(18, 0), QTime(19, 0)};
    QVERIFY(session.addEvent(QDate(2024, 1, 3), event));
    QVERIFY(!session.removeEvent(QDate(2024, 1, 3), 4));
    QVERIFY(session.removeEvent(QDate(2024, 1, 3), 0));
    QCOMPARE(session.state().eventCount(), 0);
}

void ProgramSessionTest::failedLoadKeepsState()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("broken.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    core::ProgramSession session;
    session.setRange(QDate(2024, 2, 1), QDate(2024, 2, 10));
    QSignalSpy spy(&session, &core::ProgramSession::stateChanged);

    QString error;
    QVERIFY(!session.load(path, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(session.state().start(), QDate(2024, 2, 1));
    QCOMPARE(spy.count(), 0);
}

void ProgramSessionTest::saveAppendsSuffix()
{
    QTemporaryDir dir;
    core::ProgramSession session;
    session.setRange(QDate(2024, 1, 1), QDate(2024, 1, 7));
    session.setTrainingDay(Qt::Wednesday, true);
    session.setSchedule(Qt::Wednesday, data::TimeRange{QTime(9, 0), QTime(10, 0)});

    QString error;
    QVERIFY2(session.saveJson(dir.filePath(QStringLiteral("plan")), &error), qPrintable(error));
    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("plan.json"))));
    QVERIFY2(session.exportIcs(dir.filePath(QStringLiteral("plan.ICS")), &error), qPrintable(error));
    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("plan.ICS"))));

    core::ProgramSession reloaded;
    QVERIFY(reloaded.load(dir.filePath(QStringLiteral("plan.json")), &error));
    QVERIFY(reloaded.state() == session.state());
    QVERIFY(!reloaded.pinnedOutsideDate().isValid());
}

QTEST_GUILESS_MAIN(ProgramSessionTest)
#include "ProgramSessionTest.moc"
