#include "prayer/data/JsonCodec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>
#include <cmath>

namespace prayer {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QJsonValue timestampToJson(const std::optional<QDateTime> &time)
{
    if (!time || !time->isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return QJsonValue(static_cast<double>(time->toMSecsSinceEpoch()));
}

// Milliseconds either side of the epoch that a stored timestamp may carry.
constexpr double kMaxTimestampMsecs = 8.64e15;

std::optional<QDateTime> timestampFromJson(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double msecs = value.toDouble();
    if (!std::isfinite(msecs) || std::abs(msecs) > kMaxTimestampMsecs) {
        return std::nullopt;
    }
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(msecs));
}

std::optional<QJsonObject> parseObject(const QByteArray &blob)
{
    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(blob, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    return document.object();
}

int intOr(const QJsonValue &value, int fallback)
{
    if (!value.isDouble()) {
        return fallback;
    }
    return value.toInt(fallback);
}
} // namespace

QString dateKey(const QDate &date)
{
    return date.toString(QLatin1String(DATE_FORMAT));
}

QJsonObject dailyTimesToJson(const DailyTimes &times)
{
    QJsonObject slots;
    for (PrayerId prayer : kAllPrayers) {
        slots.insert(prayerKey(prayer), timestampToJson(times.timeFor(prayer)));
    }

    QJsonObject hijri;
    hijri.insert(QStringLiteral("day"), times.hijri.day);
    hijri.insert(QStringLiteral("month"), times.hijri.month);
    hijri.insert(QStringLiteral("year"), times.hijri.year);
    hijri.insert(QStringLiteral("monthName"), times.hijri.monthName);

    QJsonObject json;
    json.insert(QStringLiteral("date"), dateKey(times.date));
    json.insert(QStringLiteral("times"), slots);
    json.insert(QStringLiteral("hijri"), hijri);
    return json;
}

std::optional<DailyTimes> dailyTimesFromJson(const QJsonObject &json)
{
    const QDate date = QDate::fromString(json.value(QStringLiteral("date")).toString(), QLatin1String(DATE_FORMAT));
    const QJsonValue slotsValue = json.value(QStringLiteral("times"));
    if (!date.isValid() || !slotsValue.isObject()) {
        return std::nullopt;
    }

    DailyTimes times;
    times.date = date;
    const QJsonObject slots = slotsValue.toObject();
    for (PrayerId prayer : kAllPrayers) {
        const QJsonValue slot = slots.value(prayerKey(prayer));
        if (slot.isNull() || slot.isUndefined()) {
            continue;
        }
        const auto time = timestampFromJson(slot);
        if (!time) {
            return std::nullopt;
        }
        times.times[indexOf(prayer)] = time;
    }

    const QJsonObject hijri = json.value(QStringLiteral("hijri")).toObject();
    times.hijri.day = hijri.value(QStringLiteral("day")).toInt();
    times.hijri.month = hijri.value(QStringLiteral("month")).toInt();
    times.hijri.year = hijri.value(QStringLiteral("year")).toInt();
    times.hijri.monthName = hijri.value(QStringLiteral("monthName")).toString();
    return times;
}

QByteArray encodeCacheEntry(const CacheEntry &entry)
{
    QJsonObject coordinates;
    coordinates.insert(QStringLiteral("latitude"), entry.coordinates.latitude);
    coordinates.insert(QStringLiteral("longitude"), entry.coordinates.longitude);

    QJsonObject json;
    json.insert(QStringLiteral("prayerTimes"), dailyTimesToJson(entry.prayerTimes));
    json.insert(QStringLiteral("coordinates"), coordinates);
    json.insert(QStringLiteral("method"), entry.method);
    json.insert(QStringLiteral("legalSchool"), entry.legalSchool);
    json.insert(QStringLiteral("cachedAt"), timestampToJson(entry.cachedAt));
    json.insert(QStringLiteral("expiresAt"), timestampToJson(entry.expiresAt));
    return QJsonDocument(json).toJson(QJsonDocument::Compact);
}

std::optional<CacheEntry> decodeCacheEntry(const QByteArray &blob)
{
    const auto json = parseObject(blob);
    if (!json) {
        return std::nullopt;
    }

    const auto times = dailyTimesFromJson(json->value(QStringLiteral("prayerTimes")).toObject());
    const QJsonObject coordinates = json->value(QStringLiteral("coordinates")).toObject();
    const QJsonValue latitude = coordinates.value(QStringLiteral("latitude"));
    const QJsonValue longitude = coordinates.value(QStringLiteral("longitude"));
    const QJsonValue method = json->value(QStringLiteral("method"));
    const QJsonValue legalSchool = json->value(QStringLiteral("legalSchool"));
    const auto cachedAt = timestampFromJson(json->value(QStringLiteral("cachedAt")));
    const auto expiresAt = timestampFromJson(json->value(QStringLiteral("expiresAt")));

    if (!times || !latitude.isDouble() || !longitude.isDouble() || !method.isString() || !legalSchool.isString()
        || !cachedAt || !expiresAt) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.prayerTimes = *times;
    entry.coordinates = Coordinates{ latitude.toDouble(), longitude.toDouble() };
    entry.method = method.toString();
    entry.legalSchool = legalSchool.toString();
    entry.cachedAt = *cachedAt;
    entry.expiresAt = *expiresAt;
    return entry;
}

QJsonObject settingsToJson(const Settings &settings)
{
    QJsonObject offsets;
    QJsonObject notifications;
    for (PrayerId prayer : kAllPrayers) {
        offsets.insert(prayerKey(prayer), settings.offsetFor(prayer));
        notifications.insert(prayerKey(prayer), settings.notificationEnabled(prayer));
    }

    QJsonObject json;
    json.insert(QStringLiteral("calculationMethod"), settings.calculationMethod);
    json.insert(QStringLiteral("legalSchool"), settings.legalSchool);
    json.insert(QStringLiteral("offsets"), offsets);
    json.insert(QStringLiteral("notifications"), notifications);
    json.insert(QStringLiteral("reminderIntervalHours"), settings.reminderIntervalHours);
    json.insert(QStringLiteral("remembranceEnabled"), settings.remembranceEnabled);
    json.insert(QStringLiteral("permissionStatus"), permissionStatusKey(settings.permissionStatus));
    json.insert(QStringLiteral("azanSound"), settings.azanSound);
    json.insert(QStringLiteral("language"), settings.language);
    json.insert(QStringLiteral("themeMode"), themeModeKey(settings.themeMode));
    json.insert(QStringLiteral("timeFormat"), timeFormatKey(settings.timeFormat));
    json.insert(QStringLiteral("dateFormat"), dateFormatKey(settings.dateFormat));
    return json;
}

Settings settingsFromJson(const QJsonObject &json)
{
    Settings settings;
    settings.calculationMethod = json.value(QStringLiteral("calculationMethod")).toString(settings.calculationMethod);
    settings.legalSchool = json.value(QStringLiteral("legalSchool")).toString(settings.legalSchool);

    const QJsonObject offsets = json.value(QStringLiteral("offsets")).toObject();
    const QJsonObject notifications = json.value(QStringLiteral("notifications")).toObject();
    for (PrayerId prayer : kAllPrayers) {
        const std::size_t slot = indexOf(prayer);
        settings.offsetMinutes[slot] =
            std::clamp(intOr(offsets.value(prayerKey(prayer)), 0), -kMaxOffsetMinutes, kMaxOffsetMinutes);
        settings.notificationsEnabled[slot] = notifications.value(prayerKey(prayer)).toBool(true);
    }

    settings.reminderIntervalHours = std::clamp(
        intOr(json.value(QStringLiteral("reminderIntervalHours")), settings.reminderIntervalHours),
        kMinReminderIntervalHours,
        kMaxReminderIntervalHours);
    settings.remembranceEnabled = json.value(QStringLiteral("remembranceEnabled")).toBool(false);
    settings.permissionStatus = permissionStatusFromKey(json.value(QStringLiteral("permissionStatus")).toString(),
                                                        settings.permissionStatus);
    settings.azanSound = json.value(QStringLiteral("azanSound")).toString(settings.azanSound);
    settings.language = json.value(QStringLiteral("language")).toString(settings.language);
    settings.themeMode = themeModeFromKey(json.value(QStringLiteral("themeMode")).toString(), settings.themeMode);
    settings.timeFormat = timeFormatFromKey(json.value(QStringLiteral("timeFormat")).toString(), settings.timeFormat);
    settings.dateFormat = dateFormatFromKey(json.value(QStringLiteral("dateFormat")).toString(), settings.dateFormat);
    return settings;
}

QByteArray encodeSettings(const Settings &settings)
{
    return QJsonDocument(settingsToJson(settings)).toJson(QJsonDocument::Compact);
}

std::optional<Settings> decodeSettings(const QByteArray &blob)
{
    const auto json = parseObject(blob);
    if (!json) {
        return std::nullopt;
    }
    return settingsFromJson(*json);
}

QByteArray encodeCompletedPrayers(const std::vector<PrayerId> &prayers)
{
    QJsonArray array;
    for (PrayerId prayer : prayers) {
        array.append(prayerKey(prayer));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

std::vector<PrayerId> decodeCompletedPrayers(const QByteArray &blob)
{
    std::vector<PrayerId> prayers;
    const QJsonDocument document = QJsonDocument::fromJson(blob);
    if (!document.isArray()) {
        return prayers;
    }
    for (const QJsonValue &value : document.array()) {
        const auto prayer = prayerFromKey(value.toString());
        if (prayer && std::find(prayers.begin(), prayers.end(), *prayer) == prayers.end()) {
            prayers.push_back(*prayer);
        }
    }
    return prayers;
}

} // namespace data
} // namespace prayer
