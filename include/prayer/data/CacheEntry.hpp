#pragma once

#include <QDateTime>
#include <QString>
#include <chrono>

#include "prayer/data/DailyTimes.hpp"
#include "prayer/data/Location.hpp"

namespace prayer {
namespace data {

// Roughly 100 m at the equator, checked per axis.
constexpr double kPositionTolerance = 0.001;

struct CacheEntry
{
    DailyTimes prayerTimes;
    Coordinates coordinates;
    QString method;
    QString legalSchool;
    QDateTime cachedAt;
    QDateTime expiresAt;
};

CacheEntry makeCacheEntry(DailyTimes prayerTimes,
                          const Coordinates &coordinates,
                          const QString &method,
                          const QString &legalSchool,
                          const QDateTime &cachedAt,
                          std::chrono::milliseconds lifetime);

bool matches(const CacheEntry &entry, const Coordinates &location, const QString &method, const QString &legalSchool);
bool isValid(const CacheEntry &entry, const QDateTime &now);
bool satisfies(const CacheEntry &entry,
               const Coordinates &location,
               const QString &method,
               const QString &legalSchool,
               const QDateTime &now);

} // namespace data
} // namespace prayer
