#include "prayer/data/CacheEntry.hpp"

#include <cmath>
#include <utility>

namespace prayer {
namespace data {

CacheEntry makeCacheEntry(DailyTimes prayerTimes,
                          const Coordinates &coordinates,
                          const QString &method,
                          const QString &legalSchool,
                          const QDateTime &cachedAt,
                          std::chrono::milliseconds lifetime)
{
    CacheEntry entry;
    entry.prayerTimes = std::move(prayerTimes);
    entry.coordinates = coordinates;
    entry.method = method;
    entry.legalSchool = legalSchool;
    entry.cachedAt = cachedAt;
    entry.expiresAt = cachedAt.addMSecs(lifetime.count());
    return entry;
}

bool matches(const CacheEntry &entry, const Coordinates &location, const QString &method, const QString &legalSchool)
{
    return std::abs(location.latitude - entry.coordinates.latitude) < kPositionTolerance
        && std::abs(location.longitude - entry.coordinates.longitude) < kPositionTolerance
        && entry.method == method
        && entry.legalSchool == legalSchool;
}

bool isValid(const CacheEntry &entry, const QDateTime &now)
{
    return entry.expiresAt.isValid() && now < entry.expiresAt;
}

bool satisfies(const CacheEntry &entry,
               const Coordinates &location,
               const QString &method,
               const QString &legalSchool,
               const QDateTime &now)
{
    return matches(entry, location, method, legalSchool) && isValid(entry, now);
}

} // namespace data
} // namespace prayer
