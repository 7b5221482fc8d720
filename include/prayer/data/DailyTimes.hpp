#pragma once

#include <QDate>
#include <QDateTime>
#include <array>
#include <optional>

#include "prayer/data/HijriDate.hpp"
#include "prayer/data/PrayerId.hpp"

namespace prayer {
namespace data {

struct UpcomingPrayer
{
    PrayerId prayer = PrayerId::Fajr;
    QDateTime time;
    bool tomorrow = false;
};

// One calendar day of prayer times. An empty slot means the calculation
// produced no time for that prayer.
struct DailyTimes
{
    QDate date;
    std::array<std::optional<QDateTime>, kPrayerCount> times;
    HijriDate hijri;

    std::optional<QDateTime> timeFor(PrayerId prayer) const;
    bool hasAnyTime() const;

    // First available slot after now; wraps to the first slot of the next day
    // when every slot has passed. Empty when no slot is available at all.
    std::optional<UpcomingPrayer> nextPrayer(const QDateTime &now) const;

    // Last available slot at or before now; empty before the first slot.
    std::optional<PrayerId> currentPrayer(const QDateTime &now) const;

    DailyTimes withOffsets(const std::array<int, kPrayerCount> &offsetMinutes) const;
};

bool operator==(const DailyTimes &lhs, const DailyTimes &rhs);
bool operator!=(const DailyTimes &lhs, const DailyTimes &rhs);

} // namespace data
} // namespace prayer
