#include <QtTest/QtTest>

#include "prayer/data/CacheEntry.hpp"
#include "support/TestDoubles.hpp"

using namespace prayer;
using namespace prayer::data;

class CacheEntryTest : public QObject
{
    Q_OBJECT

private slots:
    void hitWithinToleranceAndLifetime();
    void missOnPositionDrift();
    void missOnMethodOrSchool();
    void expiresAtLifetimeBoundary();

private:
    CacheEntry entryAt(const QDateTime &cachedAt) const;
};

CacheEntry CacheEntryTest::entryAt(const QDateTime &cachedAt) const
{
    return makeCacheEntry(testing::sampleDay(cachedAt.date()),
                          Coordinates{ 51.5, -0.12 },
                          QStringLiteral("MWL"),
                          QStringLiteral("shafi"),
                          cachedAt,
                          std::chrono::hours(24));
}

void CacheEntryTest::hitWithinToleranceAndLifetime()
{
    const QDateTime cachedAt(QDate(2024, 3, 11), QTime(3, 0));
    const CacheEntry entry = entryAt(cachedAt);

    QCOMPARE(entry.expiresAt, cachedAt.addSecs(24 * 3600));
    QVERIFY(satisfies(entry, Coordinates{ 51.5005, -0.1205 }, "MWL", "shafi", cachedAt.addSecs(3600)));
}

void CacheEntryTest::missOnPositionDrift()
{
    const QDateTime cachedAt(QDate(2024, 3, 11), QTime(3, 0));
    const CacheEntry entry = entryAt(cachedAt);

    QVERIFY(!matches(entry, Coordinates{ 51.502, -0.12 }, "MWL", "shafi"));
    QVERIFY(!matches(entry, Coordinates{ 51.5, -0.122 }, "MWL", "shafi"));
}

void CacheEntryTest::missOnMethodOrSchool()
{
    const CacheEntry entry = entryAt(QDateTime(QDate(2024, 3, 11), QTime(3, 0)));

    QVERIFY(!matches(entry, Coordinates{ 51.5, -0.12 }, "ISNA", "shafi"));
    QVERIFY(!matches(entry, Coordinates{ 51.5, -0.12 }, "MWL", "hanafi"));
    QVERIFY(!matches(entry, Coordinates{ 51.5, -0.12 }, "mwl", "shafi"));
}

void CacheEntryTest::expiresAtLifetimeBoundary()
{
    const QDateTime cachedAt(QDate(2024, 3, 11), QTime(3, 0));
    const CacheEntry entry = entryAt(cachedAt);

    QVERIFY(isValid(entry, cachedAt.addSecs(24 * 3600 - 1)));
    QVERIFY(!isValid(entry, cachedAt.addSecs(24 * 3600)));
    QVERIFY(!satisfies(entry, Coordinates{ 51.5, -0.12 }, "MWL", "shafi", cachedAt.addDays(2)));

    CacheEntry blank;
    QVERIFY(!isValid(blank, cachedAt));
}

QTEST_GUILESS_MAIN(CacheEntryTest)
#include "CacheEntryTest.moc"
