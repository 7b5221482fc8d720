#pragma once

#include <QMetaType>
#include <QString>
#include <array>

#include "prayer/data/PrayerId.hpp"

namespace prayer {
namespace data {

enum class PermissionStatus
{
    NotDetermined,
    Granted,
    Denied,
    Restricted,
};

enum class ThemeMode
{
    System,
    Light,
    Dark,
};

enum class TimeFormat
{
    TwelveHour,
    TwentyFourHour,
};

enum class DateFormatOption
{
    DayMonthYear,
    MonthDayYear,
    YearMonthDay,
};

constexpr int kMaxOffsetMinutes = 30;
constexpr int kMinReminderIntervalHours = 1;
constexpr int kMaxReminderIntervalHours = 24;

struct Settings
{
    QString calculationMethod = QStringLiteral("Auto");
    QString legalSchool = QStringLiteral("hanafi");
    std::array<int, kPrayerCount> offsetMinutes{};
    std::array<bool, kPrayerCount> notificationsEnabled{ true, true, true, true, true, true };
    int reminderIntervalHours = 4;
    bool remembranceEnabled = false;
    PermissionStatus permissionStatus = PermissionStatus::NotDetermined;

    QString azanSound = QStringLiteral("makkah_adhan.mp3");
    QString language = QStringLiteral("en");
    ThemeMode themeMode = ThemeMode::System;
    TimeFormat timeFormat = TimeFormat::TwelveHour;
    DateFormatOption dateFormat = DateFormatOption::DayMonthYear;

    int offsetFor(PrayerId prayer) const { return offsetMinutes[indexOf(prayer)]; }
    bool notificationEnabled(PrayerId prayer) const { return notificationsEnabled[indexOf(prayer)]; }
};

bool operator==(const Settings &lhs, const Settings &rhs);
bool operator!=(const Settings &lhs, const Settings &rhs);

bool isBlocked(PermissionStatus status);

QString permissionStatusKey(PermissionStatus status);
PermissionStatus permissionStatusFromKey(const QString &key, PermissionStatus fallback);
QString themeModeKey(ThemeMode mode);
ThemeMode themeModeFromKey(const QString &key, ThemeMode fallback);
QString timeFormatKey(TimeFormat format);
TimeFormat timeFormatFromKey(const QString &key, TimeFormat fallback);
QString dateFormatKey(DateFormatOption option);
DateFormatOption dateFormatFromKey(const QString &key, DateFormatOption fallback);

} // namespace data
} // namespace prayer

Q_DECLARE_METATYPE(prayer::data::PermissionStatus)
Q_DECLARE_METATYPE(prayer::data::Settings)
