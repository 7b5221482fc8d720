#pragma once

#include <QDate>
#include <QString>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "prayer/data/CacheEntry.hpp"
#include "prayer/data/PrayerCalculator.hpp"

namespace prayer {
namespace core {
class Clock;
}

namespace data {
class KeyValueStore;
}

namespace services {

// Fetch-or-compute store of daily prayer times, one entry per calendar date.
//
// At most one calculation per date is outstanding. Requests arriving while a
// date is being computed wait for it; when it completes, waiters satisfied by
// the new entry get it, the others are dispatched again. Hits are delivered
// synchronously, computed results whenever the calculator delivers them.
// Callbacks never run once the cache is destroyed.
class ScheduleCache
{
public:
    ScheduleCache(data::KeyValueStore &store,
                  data::PrayerCalculator &calculator,
                  const core::Clock &clock,
                  std::chrono::milliseconds lifetime);
    ~ScheduleCache();

    ScheduleCache(const ScheduleCache &) = delete;
    ScheduleCache &operator=(const ScheduleCache &) = delete;

    void getOrCompute(const QDate &date,
                      const data::Coordinates &location,
                      const QString &method,
                      const QString &legalSchool,
                      data::TimesCallback done);

    std::optional<data::CacheEntry> cachedEntry(const QDate &date) const;
    bool invalidate(const QDate &date);
    // Removes the entries of every date before the given one; returns how many went.
    int pruneBefore(const QDate &date);

    bool isComputing(const QDate &date) const;
    std::chrono::milliseconds lifetime() const;

    static QString keyFor(const QDate &date);

private:
    struct Waiter
    {
        data::CalculationRequest request;
        data::TimesCallback done;
    };

    struct Flight
    {
        data::CalculationRequest request;
        std::vector<Waiter> waiters;
    };

    void dispatch(const data::CalculationRequest &request, data::TimesCallback done);
    void finish(const QString &key, const data::TimesOutcome &outcome);
    std::optional<data::DailyTimes> lookup(const QString &key, const data::CalculationRequest &request) const;

    data::KeyValueStore &m_store;
    data::PrayerCalculator &m_calculator;
    const core::Clock &m_clock;
    std::chrono::milliseconds m_lifetime;
    std::map<QString, Flight> m_inFlight;
    std::shared_ptr<bool> m_alive;
};

} // namespace services
} // namespace prayer
