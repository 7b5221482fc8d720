#pragma once

#include <QDate>
#include <QString>

namespace prayer {
namespace data {

struct HijriDate
{
    int day = 0;   // 1..30
    int month = 0; // 1..12
    int year = 0;  // AH
    QString monthName;

    bool isValid() const { return day > 0 && month > 0 && year > 0; }
};

bool operator==(const HijriDate &lhs, const HijriDate &rhs);
bool operator!=(const HijriDate &lhs, const HijriDate &rhs);

// Arithmetic (tabular) Islamic calendar. May differ by a day from sighting-based calendars.
HijriDate hijriFromGregorian(const QDate &date);
QString hijriMonthName(int month);

} // namespace data
} // namespace prayer
