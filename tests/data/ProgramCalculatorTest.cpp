#include <QtTest/QtTest>

#include "planner/data/ProgramCalculator.hpp"
#include "planner/data/ProgramState.hpp"

using namespace planner::data;

namespace {
ProgramState twoWeekProgram()
{
    ProgramState state;
    state.setRange(QDate(2024, 1, 1), QDate(2024, 1, 14));
    state.setTrainingDay(Qt::Monday, true);
    state.setTrainingDay(Qt::Wednesday, true);
    state.setSchedule(Qt::Monday, TimeRange{QTime(18, 0), QTime(19, 0)});
    state.setSchedule(Qt::Wednesday, TimeRange{QTime(18, 0), QTime(19, 30)});
    return state;
}
} // namespace

class ProgramCalculatorTest : public QObject
{
    Q_OBJECT

private slots:
    void noRangeYieldsNothing();
    void singleDayProgram();
    void twoWeekProgram();
    void forcedOffDayIsExcluded();
    void unscheduledDaysCountTowardsWeeks();
    void reversedAnchorsGiveSameSummary();
    void splitsMinutesByMonth();
    void ignoresForcedDatesOutsideRange();
    void isDeterministic();
};

void ProgramCalculatorTest::noRangeYieldsNothing()
{
    ProgramState state;
    state.setStart(QDate(2024, 1, 1));
    ProgramCalculator calculator;
    QVERIFY(!calculator.calculate(state).has_value());
    QVERIFY(calculator.selectedSessions(state).isEmpty());
}

void ProgramCalculatorTest::singleDayProgram()
{
    ProgramState state;
    state.setRange(QDate(2024, 1, 1), QDate(2024, 1, 1));
    state.setSchedule(Qt::Monday, TimeRange{QTime(7, 0), QTime(8, 0)});

    const auto summary = ProgramCalculator().calculate(state);
    QVERIFY(summary.has_value());
    QCOMPARE(summary->selectedDays, 1);
    QCOMPARE(summary->totalMinutes, 60);
    QCOMPARE(summary->weeksInRange, qint64(1));
    QCOMPARE(summary->weeksWithTraining, 1);
}

void ProgramCalculatorTest::twoWeekProgram()
{
    const auto summary = ProgramCalculator().calculate(twoWeekProgram());
    QVERIFY(summary.has_value());
    QCOMPARE(summary->start, QDate(2024, 1, 1));
    QCOMPARE(summary->end, QDate(2024, 1, 14));
    QCOMPARE(summary->selectedDays, 4);
    QCOMPARE(summary->totalMinutes, 300);
    QCOMPARE(summary->weeksInRange, qint64(2));
    QCOMPARE(summary->weeksWithTraining, 2);
    QCOMPARE(summary->minutesByWeek.value(1), 150);
    QCOMPARE(summary->minutesByWeek.value(2), 150);
    QCOMPARE(summary->minutesByMonth.size(), 1);
    QCOMPARE(summary->minutesByMonth.value(YearMonth{2024, 1}), 300);
}

void ProgramCalculatorTest::forcedOffDayIsExcluded()
{
    ProgramState state = twoWeekProgram();
    state.forceOff(QDate(2024, 1, 1));

    const auto summary = ProgramCalculator().calculate(state);
    QVERIFY(summary.has_value());
    QCOMPARE(summary->selectedDays, 3);
    QCOMPARE(summary->totalMinutes, 240);
    QCOMPARE(summary->minutesByWeek.value(1), 90);
}

void ProgramCalculatorTest::unscheduledDaysCountTowardsWeeks()
{
    ProgramState state;
    state.setRange(QDate(2024, 1, 1), QDate(2024, 1, 10));

    const auto summary = ProgramCalculator().calculate(state);
    QVERIFY(summary.has_value());
    QCOMPARE(summary->selectedDays, 10);
    QCOMPARE(summary->totalMinutes, 0);
    QCOMPARE(summary->weeksInRange, qint64(2));
    QCOMPARE(summary->weeksWithTraining, 2);
    QCOMPARE(summary->minutesByWeek.value(2), 0);
}

void ProgramCalculatorTest::reversedAnchorsGiveSameSummary()
{
    ProgramState forward = twoWeekProgram();
    ProgramState backward = twoWeekProgram();
    backward.setRange(QDate(2024, 1, 14), QDate(2024, 1, 1));

    const ProgramCalculator calculator;
    const auto a = calculator.calculate(forward);
    const auto b = calculator.calculate(backward);
    QVERIFY(a && b);
    QCOMPARE(a->start, b->start);
    QCOMPARE(a->totalMinutes, b->totalMinutes);
    QCOMPARE(a->minutesByWeek, b->minutesByWeek);
}

void ProgramCalculatorTest::splitsMinutesByMonth()
{
    ProgramState state;
    state.setRange(QDate(2024, 1, 29), QDate(2024, 2, 4));
    for (Qt::DayOfWeek day : {Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Friday, Qt::Saturday,
                              Qt::Sunday}) {
        state.setSchedule(day, TimeRange{QTime(6, 0), QTime(6, 30)});
    }

    const auto summary = ProgramCalculator().calculate(state);
    QVERIFY(summary.has_value());
    QCOMPARE(summary->minutesByMonth.size(), 2);
    QCOMPARE(summary->minutesByMonth.firstKey(), (YearMonth{2024, 1}));
    QCOMPARE(summary->minutesByMonth.value(YearMonth{2024, 1}), 90);
    QCOMPARE(summary->minutesByMonth.value(YearMonth{2024, 2}), 120);
    QCOMPARE(summary->weeksInRange, qint64(1));
}

void ProgramCalculatorTest::ignoresForcedDatesOutsideRange()
{
    ProgramState state = twoWeekProgram();
    state.forceOn(QDate(2024, 1, 15));

    const auto summary = ProgramCalculator().calculate(state);
    QVERIFY(summary.has_value());
    QCOMPARE(summary->selectedDays, 4);
    QCOMPARE(ProgramCalculator::weekOfProgram(QDate(2024, 1, 1), QDate(2024, 1, 15)), 3);
}

void ProgramCalculatorTest::isDeterministic()
{
    const ProgramState state = twoWeekProgram();
    const ProgramCalculator calculator;
    const auto first = calculator.calculate(state);
    const auto second = calculator.calculate(state);
    QVERIFY(first && second);
    QCOMPARE(first->selectedDays, second->selectedDays);
    QCOMPARE(first->minutesByMonth, second->minutesByMonth);
    QCOMPARE(first->minutesByWeek, second->minutesByWeek);
}

QTEST_GUILESS_MAIN(ProgramCalculatorTest)
#include "ProgramCalculatorTest.moc"
