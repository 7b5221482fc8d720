#include "prayer/services/CompletionTracker.hpp"

#include <algorithm>
#include <cstdlib>

#include "prayer/core/Clock.hpp"
#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/JsonCodec.hpp"
#include "prayer/data/KeyValueStore.hpp"

namespace prayer {
namespace services {

namespace {
const QString kHistoryPrefix = QStringLiteral("prayer_history_");
const QString kStreakRecordKey = QStringLiteral("prayer_streak_record");
} // namespace

Streak computeStreak(data::PrayerId prayer, std::vector<CompletionRecord> records)
{
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [prayer](const CompletionRecord &record) {
                                     return record.prayer != prayer || !record.date.isValid();
                                 }),
                  records.end());
    std::sort(records.begin(), records.end(), [](const CompletionRecord &lhs, const CompletionRecord &rhs) {
        return lhs.date < rhs.date;
    });

    // A day recorded twice counts as completed if any record says so.
    std::vector<CompletionRecord> days;
    for (const CompletionRecord &record : records) {
        if (!days.empty() && days.back().date == record.date) {
            days.back().completed = days.back().completed || record.completed;
        } else {
            days.push_back(record);
        }
    }

    Streak streak;
    int run = 0;
    QDate previous;
    for (const CompletionRecord &day : days) {
        const bool consecutive = previous.isValid() && previous.daysTo(day.date) == 1;
        if (!day.completed) {
            run = 0;
        } else {
            run = consecutive ? run + 1 : 1;
        }
        streak.longest = std::max(streak.longest, run);
        previous = day.date;
    }
    streak.current = run;
    return streak;
}

CompletionTracker::CompletionTracker(data::KeyValueStore &store, const core::Clock &clock, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
{
}

QString CompletionTracker::keyFor(const QDate &date)
{
    return kHistoryPrefix + data::dateKey(date);
}

MarkResult CompletionTracker::markCompleted(data::PrayerId prayer,
                                            const QDate &date,
                                            const std::optional<QDateTime> &scheduledTime)
{
    if (!scheduledTime || !scheduledTime->isValid()) {
        qCWarning(core::lcCompletion) << "Cannot mark" << data::prayerKey(prayer) << "without a known prayer time";
        emit markRejected(prayer, date, QStringLiteral("prayer time unknown"));
        return MarkResult::TimeUnknown;
    }
    // Offsets may carry a prayer time across midnight, so one day either way is accepted.
    if (std::abs(scheduledTime->date().daysTo(date)) > 1) {
        qCWarning(core::lcCompletion) << "Prayer time" << scheduledTime->toString(Qt::ISODate) << "does not belong to"
                                      << data::dateKey(date);
        emit markRejected(prayer, date, QStringLiteral("prayer time belongs to another day"));
        return MarkResult::TimeUnknown;
    }
    if (date > today()) {
        qCInfo(core::lcCompletion) << "Refusing to mark" << data::prayerKey(prayer) << "on future date"
                                   << data::dateKey(date);
        emit markRejected(prayer, date, QStringLiteral("date has not arrived yet"));
        return MarkResult::TooEarly;
    }
    if (*scheduledTime > m_clock.now()) {
        qCInfo(core::lcCompletion) << "Refusing to mark" << data::prayerKey(prayer) << "before"
                                   << scheduledTime->toString(Qt::ISODate);
        emit markRejected(prayer, date, QStringLiteral("prayer time has not arrived yet"));
        return MarkResult::TooEarly;
    }

    std::vector<data::PrayerId> completed = completedOn(date);
    if (std::find(completed.begin(), completed.end(), prayer) != completed.end()) {
        return MarkResult::AlreadyMarked;
    }
    completed.push_back(prayer);
    write(date, completed);
    qCInfo(core::lcCompletion) << "Marked" << data::prayerKey(prayer) << "completed on" << data::dateKey(date);
    emit completionChanged(prayer, date, true);
    return MarkResult::Marked;
}

bool CompletionTracker::unmark(data::PrayerId prayer, const QDate &date)
{
    std::vector<data::PrayerId> completed = completedOn(date);
    const auto it = std::find(completed.begin(), completed.end(), prayer);
    if (it == completed.end()) {
        return false;
    }
    completed.erase(it);
    write(date, completed);
    qCInfo(core::lcCompletion) << "Unmarked" << data::prayerKey(prayer) << "on" << data::dateKey(date);
    emit completionChanged(prayer, date, false);
    return true;
}

bool CompletionTracker::isCompleted(data::PrayerId prayer, const QDate &date) const
{
    const auto completed = completedOn(date);
    return std::find(completed.begin(), completed.end(), prayer) != completed.end();
}

bool CompletionTracker::isCompletedToday(data::PrayerId prayer) const
{
    return isCompleted(prayer, today());
}

std::vector<data::PrayerId> CompletionTracker::completedOn(const QDate &date) const
{
    try {
        const auto blob = m_store.get(keyFor(date));
        if (!blob) {
            return {};
        }
        return data::decodeCompletedPrayers(*blob);
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCompletion) << "Cannot read history for" << data::dateKey(date) << ":" << error.message();
        return {};
    }
}

std::vector<CompletionRecord> CompletionTracker::records(data::PrayerId prayer, const QDate &from, const QDate &to) const
{
    std::vector<CompletionRecord> result;
    for (QDate date = from; date.isValid() && date <= to; date = date.addDays(1)) {
        result.push_back(CompletionRecord{ prayer, date, isCompleted(prayer, date) });
    }
    return result;
}

Streak CompletionTracker::streak(data::PrayerId prayer, int days) const
{
    const QDate end = today();
    return computeStreak(prayer, records(prayer, end.addDays(-(days - 1)), end));
}

int CompletionTracker::dailyStreak(int prayersPerDay)
{
    const QDate end = today();
    int streak = 0;
    for (int i = 0; i < 365; ++i) {
        if (obligatoryCount(end.addDays(-i)) < prayersPerDay) {
            break;
        }
        ++streak;
    }

    if (streak > bestDailyStreak()) {
        try {
            m_store.set(kStreakRecordKey, QByteArray::number(streak));
            qCInfo(core::lcCompletion) << "New prayer streak record:" << streak << "days";
        } catch (const core::PersistenceError &error) {
            qCWarning(core::lcCompletion) << "Cannot store streak record:" << error.message();
        }
    }
    return streak;
}

int CompletionTracker::bestDailyStreak() const
{
    try {
        const auto blob = m_store.get(kStreakRecordKey);
        return blob ? blob->toInt() : 0;
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCompletion) << "Cannot read streak record:" << error.message();
        return 0;
    }
}

std::map<data::PrayerId, int> CompletionTracker::statsForDays(int days) const
{
    std::map<data::PrayerId, int> stats;
    const QDate end = today();
    for (int i = 0; i < days; ++i) {
        for (data::PrayerId prayer : completedOn(end.addDays(-i))) {
            if (data::isObligatory(prayer)) {
                ++stats[prayer];
            }
        }
    }
    return stats;
}

double CompletionTracker::completionRate(int days, int prayersPerDay) const
{
    const int expected = days * prayersPerDay;
    if (expected <= 0) {
        return 0.0;
    }
    int completed = 0;
    for (const auto &entry : statsForDays(days)) {
        completed += entry.second;
    }
    return static_cast<double>(completed) / expected;
}

CompletionGrid CompletionTracker::completionGrid(int days) const
{
    CompletionGrid grid;
    const QDate end = today();
    for (int i = 0; i < days; ++i) {
        const QDate date = end.addDays(-i);
        const auto completed = completedOn(date);
        auto &row = grid[date];
        for (data::PrayerId prayer : data::kObligatoryPrayers) {
            row[prayer] = std::find(completed.begin(), completed.end(), prayer) != completed.end();
        }
    }
    return grid;
}

std::vector<DayPerformance> CompletionTracker::performance(const QDate &from, const QDate &to) const
{
    std::vector<DayPerformance> result;
    for (QDate date = from; date.isValid() && date <= to; date = date.addDays(1)) {
        DayPerformance day;
        day.date = date;
        day.total = kPrayersPerDay;
        for (data::PrayerId prayer : completedOn(date)) {
            if (data::isObligatory(prayer)) {
                day.completedPrayers.push_back(prayer);
            }
        }
        day.completed = static_cast<int>(day.completedPrayers.size());
        day.rate = static_cast<double>(day.completed) / day.total;
        result.push_back(day);
    }
    return result;
}

int CompletionTracker::cleanOldHistory(int keepDays)
{
    const QDate cutoff = today().addDays(-keepDays);
    int removed = 0;
    try {
        for (const QString &key : m_store.keys(kHistoryPrefix)) {
            const QDate date = QDate::fromString(key.mid(kHistoryPrefix.size()), QStringLiteral("yyyy-MM-dd"));
            if (date.isValid() && date < cutoff && m_store.remove(key)) {
                ++removed;
            }
        }
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCompletion) << "Cleaning history stopped early:" << error.message();
    }
    if (removed > 0) {
        qCInfo(core::lcCompletion) << "Removed" << removed << "days of history older than" << data::dateKey(cutoff);
    }
    return removed;
}

void CompletionTracker::write(const QDate &date, const std::vector<data::PrayerId> &prayers)
{
    if (prayers.empty()) {
        m_store.remove(keyFor(date));
        return;
    }
    m_store.set(keyFor(date), data::encodeCompletedPrayers(prayers));
}

int CompletionTracker::obligatoryCount(const QDate &date) const
{
    const auto completed = completedOn(date);
    return static_cast<int>(std::count_if(completed.begin(), completed.end(), data::isObligatory));
}

QDate CompletionTracker::today() const
{
    return m_clock.now().date();
}

} // namespace services
} // namespace prayer
