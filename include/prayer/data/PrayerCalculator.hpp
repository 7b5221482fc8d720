#pragma once

#include <QDate>
#include <QString>
#include <functional>
#include <optional>

#include "prayer/core/Errors.hpp"
#include "prayer/data/DailyTimes.hpp"
#include "prayer/data/Location.hpp"

namespace prayer {
namespace data {

struct CalculationRequest
{
    QDate date;
    Coordinates coordinates;
    QString method;
    QString legalSchool;
};

struct TimesOutcome
{
    std::optional<DailyTimes> times;
    std::optional<core::PrayerDataError> error;

    bool ok() const { return times.has_value(); }

    static TimesOutcome success(DailyTimes value);
    static TimesOutcome failure(const QString &message);
};

using TimesCallback = std::function<void(const TimesOutcome &)>;

// Produces the prayer times of one day. Results for equal requests are
// expected to be equal. The callback may run synchronously or later on the
// event loop.
class PrayerCalculator
{
public:
    virtual ~PrayerCalculator() = default;

    virtual void compute(const CalculationRequest &request, TimesCallback done) = 0;
};

} // namespace data
} // namespace prayer
