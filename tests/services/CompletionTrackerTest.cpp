#include <QtTest/QtTest>

#include "prayer/services/CompletionTracker.hpp"
#include "support/TestDoubles.hpp"

using namespace prayer;
using namespace prayer::data;
using prayer::services::CompletionRecord;
using prayer::services::CompletionTracker;
using prayer::services::MarkResult;

class CompletionTrackerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void refusesFuturePrayer();
    void refusesUnknownTime();
    void refusesFutureDate();
    void acceptsTimeShiftedPastMidnight();
    void marksOnceAndUnmarks();
    void streakOverRecords();
    void streakOfNoRecordsIsZero();
    void trackerStreakCountsBackFromToday();
    void dailyStreakKeepsBestRecord();
    void statsAndRate();
    void gridCoversObligatoryPrayers();
    void cleansOldHistory();
    void writeFailurePropagates();

private:
    static void markAll(CompletionTracker &tracker, const QDate &date, std::initializer_list<PrayerId> prayers);
};

void CompletionTrackerTest::initTestCase()
{
    qRegisterMetaType<prayer::data::PrayerId>();
}

void CompletionTrackerTest::markAll(CompletionTracker &tracker, const QDate &date, std::initializer_list<PrayerId> prayers)
{
    for (PrayerId prayer : prayers) {
        QVERIFY(tracker.markCompleted(prayer, date, QDateTime(date, QTime(0, 0))) == MarkResult::Marked);
    }
}

void CompletionTrackerTest::refusesFuturePrayer()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(10, 30)));
    CompletionTracker tracker(store, clock);
    QSignalSpy rejected(&tracker, &CompletionTracker::markRejected);
    QSignalSpy changed(&tracker, &CompletionTracker::completionChanged);

    const QDate today = clock.now().date();
    QVERIFY(tracker.markCompleted(PrayerId::Dhuhr, today, clock.now().addSecs(2 * 3600)) == MarkResult::TooEarly);
    QCOMPARE(rejected.count(), 1);
    QVERIFY(!tracker.isCompletedToday(PrayerId::Dhuhr));

    QVERIFY(tracker.markCompleted(PrayerId::Fajr, today, clock.now().addSecs(-60)) == MarkResult::Marked);
    QVERIFY(tracker.isCompletedToday(PrayerId::Fajr));
    QCOMPARE(changed.count(), 1);
}

void CompletionTrackerTest::refusesUnknownTime()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock;
    CompletionTracker tracker(store, clock);
    QSignalSpy rejected(&tracker, &CompletionTracker::markRejected);

    QVERIFY(tracker.markCompleted(PrayerId::Asr, clock.now().date(), std::nullopt) == MarkResult::TimeUnknown);
    QVERIFY(tracker.markCompleted(PrayerId::Asr, clock.now().date(), QDateTime()) == MarkResult::TimeUnknown);
    QCOMPARE(rejected.count(), 2);
    QVERIFY(store.keys().isEmpty());
}

void CompletionTrackerTest::refusesFutureDate()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(10, 30)));
    CompletionTracker tracker(store, clock);
    QSignalSpy rejected(&tracker, &CompletionTracker::markRejected);
    const QDate today = clock.now().date();

    QVERIFY(tracker.markCompleted(PrayerId::Fajr, today.addDays(5), clock.now().addSecs(-60)) == MarkResult::TimeUnknown);
    QVERIFY(tracker.markCompleted(PrayerId::Fajr, today.addDays(1), clock.now().addSecs(-60)) == MarkResult::TooEarly);
    QCOMPARE(rejected.count(), 2);
    QVERIFY(store.keys().isEmpty());
    QVERIFY(!tracker.isCompleted(PrayerId::Fajr, today.addDays(5)));
}

void CompletionTrackerTest::acceptsTimeShiftedPastMidnight()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(10, 30)));
    CompletionTracker tracker(store, clock);
    const QDate yesterday = clock.now().date().addDays(-1);

    // Isha of yesterday pushed past midnight by its offset.
    const QDateTime isha(yesterday.addDays(1), QTime(0, 10));
    QVERIFY(tracker.markCompleted(PrayerId::Isha, yesterday, isha) == MarkResult::Marked);
    QVERIFY(tracker.isCompleted(PrayerId::Isha, yesterday));
}

void CompletionTrackerTest::marksOnceAndUnmarks()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock;
    CompletionTracker tracker(store, clock);
    const QDate yesterday = clock.now().date().addDays(-1);
    const QDateTime maghrib(yesterday, QTime(18, 20));

    QVERIFY(tracker.markCompleted(PrayerId::Maghrib, yesterday, maghrib) == MarkResult::Marked);
    QVERIFY(tracker.markCompleted(PrayerId::Maghrib, yesterday, maghrib) == MarkResult::AlreadyMarked);
    QCOMPARE(tracker.completedOn(yesterday).size(), std::size_t(1));
    QVERIFY(store.get(CompletionTracker::keyFor(yesterday)).has_value());

    QVERIFY(tracker.unmark(PrayerId::Maghrib, yesterday));
    QVERIFY(!tracker.unmark(PrayerId::Maghrib, yesterday));
    QVERIFY(!tracker.isCompleted(PrayerId::Maghrib, yesterday));
    QVERIFY(!store.get(CompletionTracker::keyFor(yesterday)).has_value());
}

void CompletionTrackerTest::streakOverRecords()
{
    const QDate start(2024, 3, 1);
    std::vector<CompletionRecord> records = {
        { PrayerId::Fajr, start.addDays(4), true },
        { PrayerId::Fajr, start, true },
        { PrayerId::Fajr, start.addDays(1), true },
        { PrayerId::Fajr, start.addDays(2), true },
        { PrayerId::Fajr, start.addDays(3), false },
        { PrayerId::Isha, start.addDays(3), true },
    };

    const auto streak = services::computeStreak(PrayerId::Fajr, records);
    QCOMPARE(streak.current, 1);
    QCOMPARE(streak.longest, 3);

    // A gap between days breaks the run even when both sides are completed.
    records = { { PrayerId::Asr, start, true }, { PrayerId::Asr, start.addDays(2), true } };
    QCOMPARE(services::computeStreak(PrayerId::Asr, records).longest, 1);
}

void CompletionTrackerTest::streakOfNoRecordsIsZero()
{
    const auto streak = services::computeStreak(PrayerId::Fajr, {});
    QCOMPARE(streak.current, 0);
    QCOMPARE(streak.longest, 0);
}

void CompletionTrackerTest::trackerStreakCountsBackFromToday()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(6, 0)));
    CompletionTracker tracker(store, clock);
    const QDate today = clock.now().date();

    markAll(tracker, today.addDays(-5), { PrayerId::Fajr });
    markAll(tracker, today.addDays(-2), { PrayerId::Fajr });
    markAll(tracker, today.addDays(-1), { PrayerId::Fajr });
    markAll(tracker, today, { PrayerId::Fajr });

    const auto streak = tracker.streak(PrayerId::Fajr, 30);
    QCOMPARE(streak.current, 3);
    QCOMPARE(streak.longest, 3);
}

void CompletionTrackerTest::dailyStreakKeepsBestRecord()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(23, 0)));
    CompletionTracker tracker(store, clock);
    const QDate today = clock.now().date();
    const auto allFive = { PrayerId::Fajr, PrayerId::Dhuhr, PrayerId::Asr, PrayerId::Maghrib, PrayerId::Isha };

    markAll(tracker, today.addDays(-2), allFive);
    markAll(tracker, today.addDays(-1), allFive);
    markAll(tracker, today, allFive);
    QCOMPARE(tracker.dailyStreak(), 3);
    QCOMPARE(tracker.bestDailyStreak(), 3);

    // Sunrise does not count toward the daily total.
    tracker.unmark(PrayerId::Isha, today);
    markAll(tracker, today, { PrayerId::Sunrise });
    QCOMPARE(tracker.dailyStreak(), 0);
    QCOMPARE(tracker.bestDailyStreak(), 3);
    QCOMPARE(tracker.dailyStreak(4), 3);
}

void CompletionTrackerTest::statsAndRate()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(23, 0)));
    CompletionTracker tracker(store, clock);
    const QDate today = clock.now().date();

    markAll(tracker, today, { PrayerId::Fajr, PrayerId::Dhuhr, PrayerId::Sunrise });
    markAll(tracker, today.addDays(-1), { PrayerId::Fajr });
    markAll(tracker, today.addDays(-10), { PrayerId::Isha });

    const auto stats = tracker.statsForDays(7);
    QCOMPARE(stats.at(PrayerId::Fajr), 2);
    QCOMPARE(stats.at(PrayerId::Dhuhr), 1);
    QCOMPARE(stats.count(PrayerId::Sunrise), std::size_t(0));
    QCOMPARE(stats.count(PrayerId::Isha), std::size_t(0));

    QVERIFY(qFuzzyCompare(tracker.completionRate(2), 3.0 / 10.0));
    QCOMPARE(tracker.completionRate(0), 0.0);
}

void CompletionTrackerTest::gridCoversObligatoryPrayers()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(23, 0)));
    CompletionTracker tracker(store, clock);
    const QDate today = clock.now().date();
    markAll(tracker, today, { PrayerId::Asr, PrayerId::Sunrise });

    const auto grid = tracker.completionGrid(3);
    QCOMPARE(grid.size(), std::size_t(3));
    QCOMPARE(grid.at(today).size(), std::size_t(5));
    QVERIFY(grid.at(today).at(PrayerId::Asr));
    QVERIFY(!grid.at(today).at(PrayerId::Fajr));
    QVERIFY(!grid.at(today.addDays(-2)).at(PrayerId::Asr));

    const auto days = tracker.performance(today.addDays(-1), today);
    QCOMPARE(days.size(), std::size_t(2));
    QCOMPARE(days.back().completed, 1);
    QVERIFY(qFuzzyCompare(days.back().rate, 0.2));
    QCOMPARE(days.front().completed, 0);
}

void CompletionTrackerTest::cleansOldHistory()
{
    InMemoryKeyValueStore store;
    testing::ManualClock clock(QDateTime(QDate(2024, 3, 11), QTime(23, 0)));
    CompletionTracker tracker(store, clock);
    const QDate today = clock.now().date();
    markAll(tracker, today.addDays(-400), { PrayerId::Fajr });
    markAll(tracker, today.addDays(-100), { PrayerId::Fajr });
    markAll(tracker, today, { PrayerId::Fajr });
    store.set(QStringLiteral("app_settings"), "{}");

    QCOMPARE(tracker.cleanOldHistory(365), 1);
    QVERIFY(!tracker.isCompleted(PrayerId::Fajr, today.addDays(-400)));
    QVERIFY(tracker.isCompleted(PrayerId::Fajr, today.addDays(-100)));
    QVERIFY(store.get(QStringLiteral("app_settings")).has_value());
    QCOMPARE(tracker.cleanOldHistory(365), 0);
}

void CompletionTrackerTest::writeFailurePropagates()
{
    testing::FailingStore store;
    testing::ManualClock clock;
    CompletionTracker tracker(store, clock);
    QSignalSpy changed(&tracker, &CompletionTracker::completionChanged);
    store.failingWrites = 1;

    const QDate yesterday = clock.now().date().addDays(-1);
    QVERIFY_EXCEPTION_THROWN(tracker.markCompleted(PrayerId::Fajr, yesterday, QDateTime(yesterday, QTime(5, 0))),
                             core::PersistenceError);
    QCOMPARE(changed.count(), 0);
    QVERIFY(!tracker.isCompleted(PrayerId::Fajr, yesterday));
}

QTEST_GUILESS_MAIN(CompletionTrackerTest)
#include "CompletionTrackerTest.moc"
