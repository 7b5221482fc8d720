#include "prayer/data/Settings.hpp"

#include <utility>

namespace prayer {
namespace data {

namespace {

template <typename Enum, std::size_t N>
QString keyOf(Enum value, const std::array<std::pair<Enum, const char *>, N> &table)
{
    for (const auto &entry : table) {
        if (entry.first == value) {
            return QString::fromLatin1(entry.second);
        }
    }
    return {};
}

template <typename Enum, std::size_t N>
Enum valueOf(const QString &key, Enum fallback, const std::array<std::pair<Enum, const char *>, N> &table)
{
    for (const auto &entry : table) {
        if (key == QLatin1String(entry.second)) {
            return entry.first;
        }
    }
    return fallback;
}

const std::array<std::pair<PermissionStatus, const char *>, 4> kPermissionKeys = { {
    { PermissionStatus::NotDetermined, "notDetermined" },
    { PermissionStatus::Granted, "granted" },
    { PermissionStatus::Denied, "denied" },
    { PermissionStatus::Restricted, "restricted" },
} };

const std::array<std::pair<ThemeMode, const char *>, 3> kThemeKeys = { {
    { ThemeMode::System, "system" },
    { ThemeMode::Light, "light" },
    { ThemeMode::Dark, "dark" },
} };

const std::array<std::pair<TimeFormat, const char *>, 2> kTimeFormatKeys = { {
    { TimeFormat::TwelveHour, "twelveHour" },
    { TimeFormat::TwentyFourHour, "twentyFourHour" },
} };

const std::array<std::pair<DateFormatOption, const char *>, 3> kDateFormatKeys = { {
    { DateFormatOption::DayMonthYear, "dayMonthYear" },
    { DateFormatOption::MonthDayYear, "monthDayYear" },
    { DateFormatOption::YearMonthDay, "yearMonthDay" },
} };

} // namespace

bool operator==(const Settings &lhs, const Settings &rhs)
{
    return lhs.calculationMethod == rhs.calculationMethod
        && lhs.legalSchool == rhs.legalSchool
        && lhs.offsetMinutes == rhs.offsetMinutes
        && lhs.notificationsEnabled == rhs.notificationsEnabled
        && lhs.reminderIntervalHours == rhs.reminderIntervalHours
        && lhs.remembranceEnabled == rhs.remembranceEnabled
        && lhs.permissionStatus == rhs.permissionStatus
        && lhs.azanSound == rhs.azanSound
        && lhs.language == rhs.language
        && lhs.themeMode == rhs.themeMode
        && lhs.timeFormat == rhs.timeFormat
        && lhs.dateFormat == rhs.dateFormat;
}

bool operator!=(const Settings &lhs, const Settings &rhs)
{
    return !(lhs == rhs);
}

bool isBlocked(PermissionStatus status)
{
    return status == PermissionStatus::Denied || status == PermissionStatus::Restricted;
}

QString permissionStatusKey(PermissionStatus status)
{
    return keyOf(status, kPermissionKeys);
}

PermissionStatus permissionStatusFromKey(const QString &key, PermissionStatus fallback)
{
    return valueOf(key, fallback, kPermissionKeys);
}

QString themeModeKey(ThemeMode mode)
{
    return keyOf(mode, kThemeKeys);
}

ThemeMode themeModeFromKey(const QString &key, ThemeMode fallback)
{
    return valueOf(key, fallback, kThemeKeys);
}

QString timeFormatKey(TimeFormat format)
{
    return keyOf(format, kTimeFormatKeys);
}

TimeFormat timeFormatFromKey(const QString &key, TimeFormat fallback)
{
    return valueOf(key, fallback, kTimeFormatKeys);
}

QString dateFormatKey(DateFormatOption option)
{
    return keyOf(option, kDateFormatKeys);
}

DateFormatOption dateFormatFromKey(const QString &key, DateFormatOption fallback)
{
    return valueOf(key, fallback, kDateFormatKeys);
}

} // namespace data
} // namespace prayer
