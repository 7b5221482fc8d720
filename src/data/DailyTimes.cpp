#include "prayer/data/DailyTimes.hpp"

namespace prayer {
namespace data {

std::optional<QDateTime> DailyTimes::timeFor(PrayerId prayer) const
{
    return times[indexOf(prayer)];
}

bool DailyTimes::hasAnyTime() const
{
    for (const auto &slot : times) {
        if (slot.has_value()) {
            return true;
        }
    }
    return false;
}

std::optional<UpcomingPrayer> DailyTimes::nextPrayer(const QDateTime &now) const
{
    std::optional<UpcomingPrayer> firstAvailable;
    for (PrayerId prayer : kAllPrayers) {
        const auto &slot = times[indexOf(prayer)];
        if (!slot) {
            continue;
        }
        if (!firstAvailable) {
            firstAvailable = UpcomingPrayer{ prayer, *slot, false };
        }
        if (*slot > now) {
            return UpcomingPrayer{ prayer, *slot, false };
        }
    }

    if (!firstAvailable) {
        return std::nullopt;
    }
    firstAvailable->time = firstAvailable->time.addDays(1);
    firstAvailable->tomorrow = true;
    return firstAvailable;
}

std::optional<PrayerId> DailyTimes::currentPrayer(const QDateTime &now) const
{
    std::optional<PrayerId> current;
    for (PrayerId prayer : kAllPrayers) {
        const auto &slot = times[indexOf(prayer)];
        if (slot && *slot <= now) {
            current = prayer;
        }
    }
    return current;
}

DailyTimes DailyTimes::withOffsets(const std::array<int, kPrayerCount> &offsetMinutes) const
{
    DailyTimes shifted = *this;
    for (std::size_t i = 0; i < kPrayerCount; ++i) {
        if (shifted.times[i]) {
            shifted.times[i] = shifted.times[i]->addSecs(static_cast<qint64>(offsetMinutes[i]) * 60);
        }
    }
    return shifted;
}

bool operator==(const DailyTimes &lhs, const DailyTimes &rhs)
{
    return lhs.date == rhs.date && lhs.times == rhs.times && lhs.hijri == rhs.hijri;
}

bool operator!=(const DailyTimes &lhs, const DailyTimes &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace prayer
