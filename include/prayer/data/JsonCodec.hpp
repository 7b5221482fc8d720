#pragma once

#include <QByteArray>
#include <QDate>
#include <QJsonObject>
#include <optional>
#include <vector>

#include "prayer/data/CacheEntry.hpp"
#include "prayer/data/DailyTimes.hpp"
#include "prayer/data/PrayerId.hpp"
#include "prayer/data/Settings.hpp"

namespace prayer {
namespace data {

QJsonObject dailyTimesToJson(const DailyTimes &times);
// Empty when a slot holds anything but null or an in-range timestamp.
std::optional<DailyTimes> dailyTimesFromJson(const QJsonObject &json);

QByteArray encodeCacheEntry(const CacheEntry &entry);
// Empty when the blob is not a well-formed cache entry.
std::optional<CacheEntry> decodeCacheEntry(const QByteArray &blob);

QJsonObject settingsToJson(const Settings &settings);
// Lenient: unknown or mistyped fields keep their defaults. Offsets and the
// reminder interval are clamped to their allowed ranges.
Settings settingsFromJson(const QJsonObject &json);

QByteArray encodeSettings(const Settings &settings);
// Empty when the blob is not a JSON object.
std::optional<Settings> decodeSettings(const QByteArray &blob);

QByteArray encodeCompletedPrayers(const std::vector<PrayerId> &prayers);
std::vector<PrayerId> decodeCompletedPrayers(const QByteArray &blob);

QString dateKey(const QDate &date);

} // namespace data
} // namespace prayer
