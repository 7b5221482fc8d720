#include "prayer/data/PrayerId.hpp"

namespace prayer {
namespace data {

QString prayerKey(PrayerId prayer)
{
    switch (prayer) {
    case PrayerId::Fajr:
        return QStringLiteral("fajr");
    case PrayerId::Sunrise:
        return QStringLiteral("sunrise");
    case PrayerId::Dhuhr:
        return QStringLiteral("dhuhr");
    case PrayerId::Asr:
        return QStringLiteral("asr");
    case PrayerId::Maghrib:
        return QStringLiteral("maghrib");
    case PrayerId::Isha:
    default:
        return QStringLiteral("isha");
    }
}

QString prayerDisplayName(PrayerId prayer)
{
    switch (prayer) {
    case PrayerId::Fajr:
        return QStringLiteral("Fajr");
    case PrayerId::Sunrise:
        return QStringLiteral("Sunrise");
    case PrayerId::Dhuhr:
        return QStringLiteral("Dhuhr");
    case PrayerId::Asr:
        return QStringLiteral("Asr");
    case PrayerId::Maghrib:
        return QStringLiteral("Maghrib");
    case PrayerId::Isha:
    default:
        return QStringLiteral("Isha");
    }
}

std::optional<PrayerId> prayerFromKey(const QString &key)
{
    const QString normalized = key.trimmed().toLower();
    for (PrayerId prayer : kAllPrayers) {
        if (prayerKey(prayer) == normalized) {
            return prayer;
        }
    }
    return std::nullopt;
}

bool isObligatory(PrayerId prayer)
{
    return prayer != PrayerId::Sunrise;
}

ReminderId reminderIdFor(PrayerId prayer)
{
    return kPrayerReminderIds[indexOf(prayer)];
}

std::optional<PrayerId> prayerForReminder(ReminderId id)
{
    for (PrayerId prayer : kAllPrayers) {
        if (reminderIdFor(prayer) == id) {
            return prayer;
        }
    }
    return std::nullopt;
}

SoundCategory soundCategoryFor(PrayerId prayer)
{
    switch (prayer) {
    case PrayerId::Dhuhr:
    case PrayerId::Asr:
    case PrayerId::Maghrib:
    case PrayerId::Isha:
        return SoundCategory::Adhan;
    case PrayerId::Fajr:
    case PrayerId::Sunrise:
    default:
        return SoundCategory::Tone;
    }
}

} // namespace data
} // namespace prayer
