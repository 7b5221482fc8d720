#pragma once

#include <QDate>
#include <QDateTime>
#include <QObject>
#include <map>
#include <optional>
#include <vector>

#include "prayer/data/PrayerId.hpp"
#include "prayer/services/PrayerAnalytics.hpp"

namespace prayer {
namespace core {
class Clock;
}

namespace data {
class KeyValueStore;
}

namespace services {

struct CompletionRecord
{
    data::PrayerId prayer = data::PrayerId::Fajr;
    QDate date;
    bool completed = false;
};

struct Streak
{
    int current = 0;
    int longest = 0;
};

enum class MarkResult
{
    Marked,
    AlreadyMarked,
    TooEarly,
    TimeUnknown,
};

using CompletionGrid = std::map<QDate, std::map<data::PrayerId, bool>>;

// Streak of one prayer over its records: current counts back from the newest
// record while days are consecutive and completed, longest is the best such run.
Streak computeStreak(data::PrayerId prayer, std::vector<CompletionRecord> records);

// Per-day completion flags, stored as one JSON array of prayer keys per date.
// Mutations throw core::PersistenceError when the store rejects the write;
// reads degrade to "not completed".
class CompletionTracker : public QObject
{
    Q_OBJECT

public:
    static constexpr int kPrayersPerDay = 5;

    CompletionTracker(data::KeyValueStore &store, const core::Clock &clock, QObject *parent = nullptr);

    // Refused while the prayer's time is unknown, lies more than a day away from
    // date, or is still in the future, and for any date after today.
    MarkResult markCompleted(data::PrayerId prayer, const QDate &date, const std::optional<QDateTime> &scheduledTime);
    bool unmark(data::PrayerId prayer, const QDate &date);

    bool isCompleted(data::PrayerId prayer, const QDate &date) const;
    bool isCompletedToday(data::PrayerId prayer) const;
    std::vector<data::PrayerId> completedOn(const QDate &date) const;
    std::vector<CompletionRecord> records(data::PrayerId prayer, const QDate &from, const QDate &to) const;

    Streak streak(data::PrayerId prayer, int days = 365) const;

    // Consecutive days ending today with at least prayersPerDay obligatory
    // prayers completed. Records a new best when exceeded.
    int dailyStreak(int prayersPerDay = kPrayersPerDay);
    int bestDailyStreak() const;

    std::map<data::PrayerId, int> statsForDays(int days) const;
    double completionRate(int days, int prayersPerDay = kPrayersPerDay) const;
    CompletionGrid completionGrid(int days) const;
    std::vector<DayPerformance> performance(const QDate &from, const QDate &to) const;

    // Removes history older than keepDays days; returns the number of days removed.
    int cleanOldHistory(int keepDays);

    static QString keyFor(const QDate &date);

signals:
    void completionChanged(prayer::data::PrayerId prayer, const QDate &date, bool completed);
    void markRejected(prayer::data::PrayerId prayer, const QDate &date, const QString &reason);

private:
    void write(const QDate &date, const std::vector<data::PrayerId> &prayers);
    int obligatoryCount(const QDate &date) const;
    QDate today() const;

    data::KeyValueStore &m_store;
    const core::Clock &m_clock;
};

} // namespace services
} // namespace prayer
