#include <QtTest/QtTest>

#include "prayer/services/ScheduleCache.hpp"
#include "prayer/services/SettingsStore.hpp"
#include "prayer/viewmodels/PrayerStateViewModel.hpp"
#include "support/TestDoubles.hpp"

using namespace prayer;
using namespace prayer::data;
using prayer::services::ScheduleCache;
using prayer::services::SettingsStore;
using prayer::viewmodels::PrayerState;
using prayer::viewmodels::PrayerStateViewModel;

using namespace std::chrono_literals;

class PrayerStateViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void derivesStateAroundTheDay();
    void publishesOnlyOnChange();
    void appliesOffsets();
    void overlappingTicksAreSkipped();
    void failureKeepsLastState();
    void stopDiscardsPendingResult();
    void timerDrivesRefresh();
};

void PrayerStateViewModelTest::initTestCase()
{
    qRegisterMetaType<prayer::viewmodels::PrayerState>();
}

void PrayerStateViewModelTest::derivesStateAroundTheDay()
{
    const QDate date(2024, 3, 11);
    const DailyTimes times = testing::sampleDay(date);

    const PrayerState early = viewmodels::deriveState(times, QDateTime(date, QTime(3, 0)));
    QVERIFY(!early.currentPrayer);
    QVERIFY(early.nextPrayer == PrayerId::Fajr);
    QCOMPARE(*early.nextPrayerTime, QDateTime(date, QTime(5, 0)));

    const PrayerState afternoon = viewmodels::deriveState(times, QDateTime(date, QTime(13, 0)));
    QVERIFY(afternoon.currentPrayer == PrayerId::Dhuhr);
    QVERIFY(afternoon.nextPrayer == PrayerId::Asr);

    const PrayerState night = viewmodels::deriveState(times, QDateTime(date, QTime(23, 0)));
    QVERIFY(night.currentPrayer == PrayerId::Isha);
    QVERIFY(night.nextPrayer == PrayerId::Fajr);
    QCOMPARE(*night.nextPrayerTime, QDateTime(date.addDays(1), QTime(5, 0)));
}

void PrayerStateViewModelTest::publishesOnlyOnChange()
{
    InMemoryKeyValueStore store;
    testing::ScriptedCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    PrayerStateViewModel viewModel(settings, cache, location, clock);
    QSignalSpy changed(&viewModel, &PrayerStateViewModel::stateChanged);

    viewModel.refresh();
    QCOMPARE(changed.count(), 1);
    QVERIFY(viewModel.state().nextPrayer == PrayerId::Fajr);

    clock.advanceSecs(60);
    viewModel.refresh();
    QCOMPARE(changed.count(), 1);

    clock.set(QDateTime(QDate(2024, 3, 11), QTime(5, 10)));
    viewModel.refresh();
    QCOMPARE(changed.count(), 2);
    QVERIFY(viewModel.state().currentPrayer == PrayerId::Fajr);
    QVERIFY(viewModel.state().nextPrayer == PrayerId::Sunrise);
    QCOMPARE(calculator.calls, 1);
}

void PrayerStateViewModelTest::appliesOffsets()
{
    InMemoryKeyValueStore store;
    testing::ScriptedCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    Settings shifted;
    shifted.offsetMinutes[indexOf(PrayerId::Fajr)] = 15;
    settings.save(shifted);
    PrayerStateViewModel viewModel(settings, cache, location, clock);

    viewModel.refresh();
    QVERIFY(viewModel.state().nextPrayerTime.has_value());
    QCOMPARE(*viewModel.state().nextPrayerTime, QDateTime(QDate(2024, 3, 11), QTime(5, 15)));
}

void PrayerStateViewModelTest::overlappingTicksAreSkipped()
{
    InMemoryKeyValueStore store;
    testing::DeferredCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    PrayerStateViewModel viewModel(settings, cache, location, clock);
    QSignalSpy changed(&viewModel, &PrayerStateViewModel::stateChanged);

    viewModel.refresh();
    QVERIFY(viewModel.isRefreshing());
    viewModel.refresh();
    viewModel.refresh();
    QCOMPARE(calculator.pending.size(), std::size_t(1));

    calculator.succeedNext();
    QVERIFY(!viewModel.isRefreshing());
    QCOMPARE(changed.count(), 1);
}

void PrayerStateViewModelTest::failureKeepsLastState()
{
    InMemoryKeyValueStore store;
    testing::ScriptedCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    PrayerStateViewModel viewModel(settings, cache, location, clock);
    QSignalSpy changed(&viewModel, &PrayerStateViewModel::stateChanged);
    QSignalSpy failed(&viewModel, &PrayerStateViewModel::refreshFailed);

    viewModel.refresh();
    const PrayerState before = viewModel.state();

    Settings other;
    other.calculationMethod = QStringLiteral("MWL");
    settings.save(other);
    calculator.failing = true;
    clock.set(QDateTime(QDate(2024, 3, 11), QTime(13, 0)));
    viewModel.refresh();

    QCOMPARE(failed.count(), 1);
    QCOMPARE(failed.takeFirst().at(0).toString(), QStringLiteral("calculator offline"));
    QCOMPARE(changed.count(), 1);
    QVERIFY(viewModel.state() == before);
    QVERIFY(!viewModel.isRefreshing());
}

void PrayerStateViewModelTest::stopDiscardsPendingResult()
{
    InMemoryKeyValueStore store;
    testing::DeferredCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    PrayerStateViewModel viewModel(settings, cache, location, clock);
    QSignalSpy changed(&viewModel, &PrayerStateViewModel::stateChanged);

    viewModel.refresh();
    viewModel.stop();
    QVERIFY(!viewModel.isRefreshing());

    calculator.succeedNext();
    QCOMPARE(changed.count(), 0);
    QVERIFY(!viewModel.state().nextPrayer);
}

void PrayerStateViewModelTest::timerDrivesRefresh()
{
    InMemoryKeyValueStore store;
    testing::ScriptedCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    SettingsStore settings(store);
    PrayerStateViewModel viewModel(settings, cache, location, clock);
    QSignalSpy changed(&viewModel, &PrayerStateViewModel::stateChanged);

    viewModel.start(20ms);
    QVERIFY(viewModel.isRunning());
    QCOMPARE(changed.count(), 1);

    clock.set(QDateTime(QDate(2024, 3, 11), QTime(12, 45)));
    QTRY_COMPARE(changed.count(), 2);
    QVERIFY(viewModel.state().currentPrayer == PrayerId::Dhuhr);

    viewModel.stop();
    QVERIFY(!viewModel.isRunning());
}

QTEST_GUILESS_MAIN(PrayerStateViewModelTest)
#include "PrayerStateViewModelTest.moc"
