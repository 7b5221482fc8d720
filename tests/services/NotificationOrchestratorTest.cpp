#include <QtTest/QtTest>
#include <optional>

#include "prayer/data/Location.hpp"
#include "prayer/services/NotificationOrchestrator.hpp"
#include "prayer/services/ScheduleCache.hpp"
#include "support/TestDoubles.hpp"

using namespace prayer;
using namespace prayer::data;
using prayer::services::NotificationOrchestrator;
using prayer::services::ScheduleCache;

class NotificationOrchestratorTest : public QObject
{
    Q_OBJECT

private slots:
    void schedulesEveryEnabledPrayer();
    void fajrOffsetShiftsReminder();
    void disabledFajrIsNotScheduled();
    void reschedulingIsIdempotent();
    void pastPrayersAreSkipped();
    void failureLeavesRemindersUntouched();
    void newerPassSupersedesOlder();
    void remembranceRearmsAfterDelivery();
    void remembranceRearmsWhenSuppressed();
    void rolloverArmedForMidnight();
    void dayChangeSchedulesNextDay();
    void shutdownStopsRearming();
};

namespace {

struct Fixture
{
    InMemoryKeyValueStore store;
    testing::ScriptedCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location{ Coordinates{ 51.5074, -0.1278 } };
    testing::RecordingSink sink;
    ScheduleCache cache{ store, calculator, clock, std::chrono::hours(24) };
    NotificationOrchestrator orchestrator{ cache, sink, location, clock };
};

bool runPass(NotificationOrchestrator &orchestrator, const Settings &settings)
{
    std::optional<bool> result;
    orchestrator.recalculateAndReschedule(settings, [&result](bool ok) { result = ok; });
    return result.value_or(false);
}

} // namespace

void NotificationOrchestratorTest::schedulesEveryEnabledPrayer()
{
    Fixture f;
    QSignalSpy rescheduled(&f.orchestrator, &NotificationOrchestrator::rescheduled);

    QVERIFY(runPass(f.orchestrator, Settings{}));
    QCOMPARE(f.sink.pending.size(), std::size_t(6));
    QCOMPARE(rescheduled.count(), 1);
    QCOMPARE(rescheduled.takeFirst().at(0).toInt(), 6);

    const auto &fajr = f.sink.pending.at(ReminderId::Fajr);
    QCOMPARE(fajr.title, QStringLiteral("Fajr Prayer"));
    QVERIFY(fajr.sound == SoundCategory::Tone);
    QVERIFY(fajr.soundFile.isEmpty());

    const auto &dhuhr = f.sink.pending.at(ReminderId::Dhuhr);
    QCOMPARE(dhuhr.title, QStringLiteral("Dhuhr Adhan"));
    QCOMPARE(dhuhr.body, QStringLiteral("Time for Dhuhr prayer - 12:30"));
    QVERIFY(dhuhr.sound == SoundCategory::Adhan);
    QCOMPARE(dhuhr.soundFile, QStringLiteral("makkah_adhan.mp3"));

    QVERIFY(f.sink.pending.at(ReminderId::Sunrise).sound == SoundCategory::Tone);
    QVERIFY(f.sink.pending.at(ReminderId::Isha).sound == SoundCategory::Adhan);
}

void NotificationOrchestratorTest::fajrOffsetShiftsReminder()
{
    Fixture f;
    Settings settings;
    settings.offsetMinutes[indexOf(PrayerId::Fajr)] = 5;

    QVERIFY(runPass(f.orchestrator, settings));
    const auto &fajr = f.sink.pending.at(ReminderId::Fajr);
    QCOMPARE(fajr.time, QDateTime(QDate(2024, 3, 11), QTime(5, 5)));
    QCOMPARE(fajr.body, QStringLiteral("Time for Fajr prayer - 05:05"));
}

void NotificationOrchestratorTest::disabledFajrIsNotScheduled()
{
    Fixture f;
    Settings settings;
    settings.notificationsEnabled[indexOf(PrayerId::Fajr)] = false;

    QVERIFY(runPass(f.orchestrator, settings));
    QVERIFY(!f.sink.has(ReminderId::Fajr));
    QCOMPARE(f.sink.pending.size(), std::size_t(5));
}

void NotificationOrchestratorTest::reschedulingIsIdempotent()
{
    Fixture f;
    Settings settings;
    settings.offsetMinutes[indexOf(PrayerId::Asr)] = -10;

    QVERIFY(runPass(f.orchestrator, settings));
    const auto first = f.sink.pending;
    QVERIFY(runPass(f.orchestrator, settings));

    QCOMPARE(f.sink.pending.size(), first.size());
    for (const auto &entry : first) {
        QVERIFY(f.sink.has(entry.first));
        QCOMPARE(f.sink.pending.at(entry.first).time, entry.second.time);
        QCOMPARE(f.sink.pending.at(entry.first).title, entry.second.title);
    }
    QCOMPARE(f.calculator.calls, 1);
}

void NotificationOrchestratorTest::pastPrayersAreSkipped()
{
    Fixture f;
    f.clock.set(QDateTime(QDate(2024, 3, 11), QTime(13, 0)));

    QVERIFY(runPass(f.orchestrator, Settings{}));
    QCOMPARE(f.sink.pending.size(), std::size_t(3));
    QVERIFY(f.sink.has(ReminderId::Asr));
    QVERIFY(!f.sink.has(ReminderId::Dhuhr));
}

void NotificationOrchestratorTest::failureLeavesRemindersUntouched()
{
    Fixture f;
    QVERIFY(runPass(f.orchestrator, Settings{}));
    const int cancels = f.sink.cancelCalls;

    f.calculator.failing = true;
    Settings changed;
    changed.calculationMethod = QStringLiteral("ISNA");
    QSignalSpy failed(&f.orchestrator, &NotificationOrchestrator::rescheduleFailed);

    QVERIFY(!runPass(f.orchestrator, changed));
    QCOMPARE(failed.count(), 1);
    QCOMPARE(f.sink.cancelCalls, cancels);
    QCOMPARE(f.sink.pending.size(), std::size_t(6));
}

void NotificationOrchestratorTest::newerPassSupersedesOlder()
{
    InMemoryKeyValueStore store;
    testing::DeferredCalculator calculator;
    testing::ManualClock clock;
    FixedLocationSource location(Coordinates{ 51.5074, -0.1278 });
    testing::RecordingSink sink;
    ScheduleCache cache(store, calculator, clock, std::chrono::hours(24));
    NotificationOrchestrator orchestrator(cache, sink, location, clock);
    QSignalSpy rescheduled(&orchestrator, &NotificationOrchestrator::rescheduled);

    Settings older;
    Settings newer;
    newer.calculationMethod = QStringLiteral("ISNA");
    newer.notificationsEnabled[indexOf(PrayerId::Isha)] = false;

    std::optional<bool> olderResult;
    std::optional<bool> newerResult;
    orchestrator.recalculateAndReschedule(older, [&olderResult](bool ok) { olderResult = ok; });
    orchestrator.recalculateAndReschedule(newer, [&newerResult](bool ok) { newerResult = ok; });

    calculator.succeedNext();
    QVERIFY(olderResult && !*olderResult);
    QVERIFY(sink.pending.empty());

    calculator.succeedNext();
    QVERIFY(newerResult && *newerResult);
    QCOMPARE(rescheduled.count(), 1);
    QCOMPARE(sink.pending.size(), std::size_t(5));
    QVERIFY(!sink.has(ReminderId::Isha));
}

void NotificationOrchestratorTest::remembranceRearmsAfterDelivery()
{
    Fixture f;
    Settings settings;
    settings.remembranceEnabled = true;
    settings.reminderIntervalHours = 2;

    f.orchestrator.scheduleRemembrance(settings);
    QVERIFY(f.orchestrator.isRemembranceArmed());
    QCOMPARE(f.sink.pending.at(ReminderId::Remembrance).time, f.clock.now().addSecs(2 * 3600));
    QCOMPARE(f.sink.pending.at(ReminderId::Remembrance).title, QStringLiteral("Dhikr Reminder"));

    f.clock.advanceSecs(2 * 3600);
    f.sink.deliver(ReminderId::Remembrance);
    QVERIFY(f.sink.has(ReminderId::Remembrance));
    QCOMPARE(f.sink.pending.at(ReminderId::Remembrance).time, f.clock.now().addSecs(2 * 3600));

    f.orchestrator.cancelRemembrance();
    QVERIFY(!f.sink.has(ReminderId::Remembrance));
    f.sink.deliver(ReminderId::Remembrance);
    QVERIFY(!f.sink.has(ReminderId::Remembrance));
}

void NotificationOrchestratorTest::remembranceRearmsWhenSuppressed()
{
    Fixture f;
    Settings settings;
    settings.remembranceEnabled = true;
    settings.reminderIntervalHours = 3;
    f.orchestrator.scheduleRemembrance(settings);

    f.clock.advanceSecs(3 * 3600);
    f.sink.suppress(ReminderId::Remembrance);
    QVERIFY(f.sink.has(ReminderId::Remembrance));
    QCOMPARE(f.sink.pending.at(ReminderId::Remembrance).time, f.clock.now().addSecs(3 * 3600));
}

void NotificationOrchestratorTest::rolloverArmedForMidnight()
{
    Fixture f;
    QVERIFY(!f.orchestrator.isRolloverArmed());

    QVERIFY(runPass(f.orchestrator, Settings{}));
    QVERIFY(f.orchestrator.isRolloverArmed());
    QCOMPARE(f.orchestrator.nextRollover(), QDateTime(QDate(2024, 3, 12), QTime(0, 0)));

    f.orchestrator.shutdown();
    QVERIFY(!f.orchestrator.isRolloverArmed());
}

void NotificationOrchestratorTest::dayChangeSchedulesNextDay()
{
    Fixture f;
    f.clock.set(QDateTime(QDate(2024, 3, 11), QTime(19, 0)));
    QSignalSpy dayChanged(&f.orchestrator, &NotificationOrchestrator::dayChanged);

    QVERIFY(runPass(f.orchestrator, Settings{}));
    QCOMPARE(f.sink.pending.size(), std::size_t(1));
    f.clock.set(QDateTime(QDate(2024, 3, 11), QTime(19, 45)));
    f.sink.deliver(ReminderId::Isha);
    QVERIFY(f.sink.pending.empty());

    f.clock.set(QDateTime(QDate(2024, 3, 12), QTime(0, 0, 5)));
    f.orchestrator.handleDayChange();

    QCOMPARE(dayChanged.count(), 1);
    QCOMPARE(dayChanged.takeFirst().at(0).toDate(), QDate(2024, 3, 12));
    QCOMPARE(f.calculator.calls, 2);
    QCOMPARE(f.sink.pending.size(), std::size_t(6));
    for (const auto &entry : f.sink.pending) {
        QCOMPARE(entry.second.time.date(), QDate(2024, 3, 12));
    }
    QCOMPARE(f.orchestrator.nextRollover(), QDateTime(QDate(2024, 3, 13), QTime(0, 0)));
}

void NotificationOrchestratorTest::shutdownStopsRearming()
{
    Fixture f;
    Settings settings;
    settings.remembranceEnabled = true;
    f.orchestrator.scheduleRemembrance(settings);

    f.orchestrator.shutdown();
    f.sink.deliver(ReminderId::Remembrance);
    QVERIFY(!f.sink.has(ReminderId::Remembrance));
    QVERIFY(!runPass(f.orchestrator, Settings{}));
}

QTEST_GUILESS_MAIN(NotificationOrchestratorTest)
#include "NotificationOrchestratorTest.moc"
