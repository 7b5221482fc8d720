#include "prayer/data/PrayerCalculator.hpp"

#include <utility>

namespace prayer {
namespace data {

TimesOutcome TimesOutcome::success(DailyTimes value)
{
    TimesOutcome outcome;
    outcome.times = std::move(value);
    return outcome;
}

TimesOutcome TimesOutcome::failure(const QString &message)
{
    TimesOutcome outcome;
    outcome.error = core::PrayerDataError(message);
    return outcome;
}

} // namespace data
} // namespace prayer
