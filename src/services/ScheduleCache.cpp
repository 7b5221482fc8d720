#include "prayer/services/ScheduleCache.hpp"

#include <cmath>
#include <utility>

#include "prayer/core/Clock.hpp"
#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/JsonCodec.hpp"
#include "prayer/data/KeyValueStore.hpp"

namespace prayer {
namespace services {

namespace {

const QString kKeyPrefix = QStringLiteral("prayer_times_");

bool sameRequest(const data::CalculationRequest &lhs, const data::CalculationRequest &rhs)
{
    return lhs.date == rhs.date
        && std::abs(lhs.coordinates.latitude - rhs.coordinates.latitude) < data::kPositionTolerance
        && std::abs(lhs.coordinates.longitude - rhs.coordinates.longitude) < data::kPositionTolerance
        && lhs.method == rhs.method
        && lhs.legalSchool == rhs.legalSchool;
}

} // namespace

ScheduleCache::ScheduleCache(data::KeyValueStore &store,
                             data::PrayerCalculator &calculator,
                             const core::Clock &clock,
                             std::chrono::milliseconds lifetime)
    : m_store(store)
    , m_calculator(calculator)
    , m_clock(clock)
    , m_lifetime(lifetime)
    , m_alive(std::make_shared<bool>(true))
{
}

ScheduleCache::~ScheduleCache() = default;

QString ScheduleCache::keyFor(const QDate &date)
{
    return kKeyPrefix + data::dateKey(date);
}

void ScheduleCache::getOrCompute(const QDate &date,
                                 const data::Coordinates &location,
                                 const QString &method,
                                 const QString &legalSchool,
                                 data::TimesCallback done)
{
    dispatch(data::CalculationRequest{ date, location, method, legalSchool }, std::move(done));
}

void ScheduleCache::dispatch(const data::CalculationRequest &request, data::TimesCallback done)
{
    const QString key = keyFor(request.date);

    if (const auto hit = lookup(key, request)) {
        qCDebug(core::lcCache) << "Cache hit for" << key;
        done(data::TimesOutcome::success(*hit));
        return;
    }

    auto flight = m_inFlight.find(key);
    if (flight != m_inFlight.end()) {
        qCDebug(core::lcCache) << "Joining calculation in flight for" << key;
        flight->second.waiters.push_back(Waiter{ request, std::move(done) });
        return;
    }

    qCDebug(core::lcCache) << "Cache miss for" << key << "method" << request.method << "school" << request.legalSchool;
    Flight next;
    next.request = request;
    next.waiters.push_back(Waiter{ request, std::move(done) });
    m_inFlight.emplace(key, std::move(next));

    std::weak_ptr<bool> alive = m_alive;
    m_calculator.compute(request, [this, alive, key](const data::TimesOutcome &outcome) {
        if (alive.expired()) {
            return;
        }
        finish(key, outcome);
    });
}

void ScheduleCache::finish(const QString &key, const data::TimesOutcome &outcome)
{
    auto it = m_inFlight.find(key);
    if (it == m_inFlight.end()) {
        return;
    }
    Flight flight = std::move(it->second);
    m_inFlight.erase(it);

    std::optional<data::CacheEntry> entry;
    if (outcome.ok()) {
        entry = data::makeCacheEntry(*outcome.times,
                                     flight.request.coordinates,
                                     flight.request.method,
                                     flight.request.legalSchool,
                                     m_clock.now(),
                                     m_lifetime);
        try {
            m_store.set(key, data::encodeCacheEntry(*entry));
        } catch (const core::PersistenceError &error) {
            qCWarning(core::lcCache) << "Could not persist" << key << ":" << error.message();
        }
    } else {
        qCWarning(core::lcCache) << "Calculation failed for" << key << ":" << outcome.error->message();
    }

    std::weak_ptr<bool> alive = m_alive;
    for (Waiter &waiter : flight.waiters) {
        if (alive.expired()) {
            return;
        }
        const auto &request = waiter.request;
        if (entry && data::matches(*entry, request.coordinates, request.method, request.legalSchool)) {
            waiter.done(data::TimesOutcome::success(entry->prayerTimes));
        } else if (!entry && sameRequest(request, flight.request)) {
            waiter.done(outcome);
        } else {
            dispatch(request, std::move(waiter.done));
        }
    }
}

std::optional<data::DailyTimes> ScheduleCache::lookup(const QString &key, const data::CalculationRequest &request) const
{
    std::optional<QByteArray> blob;
    try {
        blob = m_store.get(key);
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCache) << "Could not read" << key << ":" << error.message();
        return std::nullopt;
    }
    if (!blob) {
        return std::nullopt;
    }

    const auto entry = data::decodeCacheEntry(*blob);
    if (!entry) {
        qCWarning(core::lcCache) << "Malformed cached prayer data under" << key << ", recomputing";
        return std::nullopt;
    }
    if (!data::satisfies(*entry, request.coordinates, request.method, request.legalSchool, m_clock.now())) {
        return std::nullopt;
    }
    return entry->prayerTimes;
}

std::optional<data::CacheEntry> ScheduleCache::cachedEntry(const QDate &date) const
{
    const QString key = keyFor(date);
    try {
        const auto blob = m_store.get(key);
        if (!blob) {
            return std::nullopt;
        }
        return data::decodeCacheEntry(*blob);
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCache) << "Could not read" << key << ":" << error.message();
        return std::nullopt;
    }
}

bool ScheduleCache::invalidate(const QDate &date)
{
    const QString key = keyFor(date);
    try {
        return m_store.remove(key);
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCache) << "Could not remove" << key << ":" << error.message();
        return false;
    }
}

int ScheduleCache::pruneBefore(const QDate &date)
{
    int removed = 0;
    try {
        for (const QString &key : m_store.keys(kKeyPrefix)) {
            const QDate entryDate = QDate::fromString(key.mid(kKeyPrefix.size()), QStringLiteral("yyyy-MM-dd"));
            if (entryDate.isValid() && entryDate < date && m_store.remove(key)) {
                ++removed;
            }
        }
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcCache) << "Pruning cached prayer times stopped early:" << error.message();
    }
    if (removed > 0) {
        qCInfo(core::lcCache) << "Pruned" << removed << "cached days before" << data::dateKey(date);
    }
    return removed;
}

bool ScheduleCache::isComputing(const QDate &date) const
{
    return m_inFlight.count(keyFor(date)) > 0;
}

std::chrono::milliseconds ScheduleCache::lifetime() const
{
    return m_lifetime;
}

} // namespace services
} // namespace prayer
