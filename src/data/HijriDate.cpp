#include "prayer/data/HijriDate.hpp"

namespace prayer {
namespace data {

bool operator==(const HijriDate &lhs, const HijriDate &rhs)
{
    return lhs.day == rhs.day && lhs.month == rhs.month && lhs.year == rhs.year;
}

bool operator!=(const HijriDate &lhs, const HijriDate &rhs)
{
    return !(lhs == rhs);
}

QString hijriMonthName(int month)
{
    static const char *const names[12] = {
        "Muharram", "Safar",   "Rabi' I", "Rabi' II", "Jumada I",    "Jumada II",
        "Rajab",    "Sha'ban", "Ramadan", "Shawwal",  "Dhul-Qa'dah", "Dhul-Hijjah",
    };
    if (month < 1 || month > 12) {
        return {};
    }
    return QString::fromLatin1(names[month - 1]);
}

HijriDate hijriFromGregorian(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }

    // Integer form of the 30-year cycle; epoch is 1 Muharram 1 AH (civil).
    qint64 l = date.toJulianDay() - 1948440 + 10632;
    const qint64 n = (l - 1) / 10631;
    l = l - 10631 * n + 354;
    const qint64 j = ((10985 - l) / 5316) * ((50 * l) / 17719) + (l / 5670) * ((43 * l) / 15238);
    l = l - ((30 - j) / 15) * ((17719 * j) / 50) - (j / 16) * ((15238 * j) / 43) + 29;
    const qint64 m = (24 * l) / 709;
    const qint64 d = l - (709 * m) / 24;
    const qint64 y = 30 * n + j - 30;

    HijriDate hijri;
    hijri.day = static_cast<int>(d);
    hijri.month = static_cast<int>(m);
    hijri.year = static_cast<int>(y);
    hijri.monthName = hijriMonthName(hijri.month);
    return hijri;
}

} // namespace data
} // namespace prayer
