#pragma once

#include <QDate>
#include <map>
#include <vector>

#include "prayer/data/PrayerId.hpp"

namespace prayer {
namespace services {

struct DayPerformance
{
    QDate date;
    int completed = 0;
    int total = 5;
    double rate = 0.0;
    std::vector<data::PrayerId> completedPrayers;
};

enum class TrendDirection
{
    Improving,
    Stable,
    Declining,
};

struct TrendReport
{
    double averageCompletionRate = 0.0;
    double trendSlope = 0.0;
    TrendDirection direction = TrendDirection::Stable;
    int bestDayCount = 0;
    int worstDayCount = 0;
    double averagePrayersPerDay = 0.0;
    std::map<data::PrayerId, double> perPrayerRates;
    std::vector<DayPerformance> days;
};

// Slopes within this band count as stable.
constexpr double kTrendThreshold = 0.001;

// Least-squares slope of the completion rate over the day index.
double trendSlope(const std::vector<DayPerformance> &days);
TrendReport analyzeTrends(const std::vector<DayPerformance> &days);

// 0..100: up to 60 points for the average rate, +20 when improving, -10 when
// declining, up to 20 points for the share of days at 80% or better.
int consistencyScore(const TrendReport &report);

} // namespace services
} // namespace prayer
