#pragma once

#include <QMetaType>
#include <QString>
#include <array>
#include <cstddef>
#include <optional>

namespace prayer {
namespace data {

enum class PrayerId
{
    Fajr,
    Sunrise,
    Dhuhr,
    Asr,
    Maghrib,
    Isha,
};

constexpr std::size_t kPrayerCount = 6;

constexpr std::array<PrayerId, kPrayerCount> kAllPrayers = {
    PrayerId::Fajr, PrayerId::Sunrise, PrayerId::Dhuhr, PrayerId::Asr, PrayerId::Maghrib, PrayerId::Isha,
};

// The five obligatory prayers; sunrise is tracked for scheduling only.
constexpr std::array<PrayerId, 5> kObligatoryPrayers = {
    PrayerId::Fajr, PrayerId::Dhuhr, PrayerId::Asr, PrayerId::Maghrib, PrayerId::Isha,
};

constexpr std::size_t indexOf(PrayerId prayer)
{
    return static_cast<std::size_t>(prayer);
}

// Reminder ids are stable across releases: prayers use their ordinal, the
// remembrance reminder shares one id.
enum class ReminderId : int
{
    Fajr = 0,
    Sunrise = 1,
    Dhuhr = 2,
    Asr = 3,
    Maghrib = 4,
    Isha = 5,
    Remembrance = 9999,
};

constexpr std::array<ReminderId, kPrayerCount> kPrayerReminderIds = {
    ReminderId::Fajr, ReminderId::Sunrise, ReminderId::Dhuhr, ReminderId::Asr, ReminderId::Maghrib, ReminderId::Isha,
};

enum class SoundCategory
{
    Adhan,
    Tone,
};

QString prayerKey(PrayerId prayer);
QString prayerDisplayName(PrayerId prayer);
std::optional<PrayerId> prayerFromKey(const QString &key);
bool isObligatory(PrayerId prayer);

ReminderId reminderIdFor(PrayerId prayer);
std::optional<PrayerId> prayerForReminder(ReminderId id);
SoundCategory soundCategoryFor(PrayerId prayer);

} // namespace data
} // namespace prayer

Q_DECLARE_METATYPE(prayer::data::PrayerId)
Q_DECLARE_METATYPE(prayer::data::ReminderId)
