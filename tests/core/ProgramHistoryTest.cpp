#include <QtTest/QtTest>

#include "planner/core/ProgramHistory.hpp"

using namespace planner;

namespace {
data::ProgramState stateStartingAt(int day)
{
    data::ProgramState state;
    state.setStart(QDate(2024, 1, day));
    return state;
}
} // namespace

class ProgramHistoryTest : public QObject
{
    Q_OBJECT

private slots:
    void recordUndoRedo();
    void recordDropsRedoTail();
    void respectsLimit();
};

void ProgramHistoryTest::recordUndoRedo()
{
    core::ProgramHistory history;
    data::ProgramState state = stateStartingAt(2);
    history.record(QStringLiteral("move"), stateStartingAt(1), state);
    QVERIFY(history.canUndo());
    QVERIFY(!history.canRedo());

    QCOMPARE(history.undo(state), QStringLiteral("move"));
    QCOMPARE(state.start(), QDate(2024, 1, 1));
    QVERIFY(history.canRedo());

    QCOMPARE(history.redo(state), QStringLiteral("move"));
    QCOMPARE(state.start(), QDate(2024, 1, 2));
    QVERIFY(history.redo(state).isEmpty());
}

void ProgramHistoryTest::recordDropsRedoTail()
{
    core::ProgramHistory history;
    data::ProgramState state;
    history.record(QStringLiteral("a"), stateStartingAt(1), stateStartingAt(2));
    history.record(QStringLiteral("b"), stateStartingAt(2), stateStartingAt(3));
    history.undo(state);
    history.record(QStringLiteral("c"), stateStartingAt(2), stateStartingAt(4));

    QCOMPARE(history.count(), static_cast<std::size_t>(2));
    QVERIFY(!history.canRedo());
    QCOMPARE(history.undo(state), QStringLiteral("c"));
    QCOMPARE(history.undo(state), QStringLiteral("a"));
    QCOMPARE(state.start(), QDate(2024, 1, 1));
}

void ProgramHistoryTest::respectsLimit()
{
    core::ProgramHistory history(2);
    data::ProgramState state;
    history.record(QStringLiteral("1"), stateStartingAt(1), stateStartingAt(2));
    history.record(QStringLiteral("2"), stateStartingAt(2), stateStartingAt(3));
    history.record(QStringLiteral("3"), stateStartingAt(3), stateStartingAt(4)); // first entry dropped
    QCOMPARE(history.count(), static_cast<std::size_t>(2));

    history.undo(state);
    history.undo(state);
    QVERIFY(!history.canUndo());
    QCOMPARE(state.start(), QDate(2024, 1, 2));
}

QTEST_GUILESS_MAIN(ProgramHistoryTest)
#include "ProgramHistoryTest.moc"
