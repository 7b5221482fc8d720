#include "prayer/services/PrayerAnalytics.hpp"

#include <algorithm>
#include <cmath>

namespace prayer {
namespace services {

double trendSlope(const std::vector<DayPerformance> &days)
{
    if (days.size() < 2) {
        return 0.0;
    }

    const double n = static_cast<double>(days.size());
    double sumX = 0.0;
    double sumY = 0.0;
    double sumXY = 0.0;
    double sumXX = 0.0;
    for (std::size_t i = 0; i < days.size(); ++i) {
        const double x = static_cast<double>(i);
        sumX += x;
        sumY += days[i].rate;
        sumXY += x * days[i].rate;
        sumXX += x * x;
    }

    const double denominator = n * sumXX - sumX * sumX;
    if (denominator == 0.0) {
        return 0.0;
    }
    const double slope = (n * sumXY - sumX * sumY) / denominator;
    return std::isnan(slope) ? 0.0 : slope;
}

TrendReport analyzeTrends(const std::vector<DayPerformance> &days)
{
    TrendReport report;
    if (days.empty()) {
        return report;
    }
    report.days = days;

    double rateSum = 0.0;
    int completedSum = 0;
    report.bestDayCount = days.front().completed;
    report.worstDayCount = days.front().completed;
    std::map<data::PrayerId, int> perPrayer;
    for (const DayPerformance &day : days) {
        rateSum += day.rate;
        completedSum += day.completed;
        report.bestDayCount = std::max(report.bestDayCount, day.completed);
        report.worstDayCount = std::min(report.worstDayCount, day.completed);
        for (data::PrayerId prayer : day.completedPrayers) {
            ++perPrayer[prayer];
        }
    }

    const double count = static_cast<double>(days.size());
    report.averageCompletionRate = rateSum / count;
    report.averagePrayersPerDay = completedSum / count;
    for (data::PrayerId prayer : data::kObligatoryPrayers) {
        report.perPrayerRates[prayer] = perPrayer[prayer] / count;
    }

    report.trendSlope = trendSlope(days);
    if (report.trendSlope > kTrendThreshold) {
        report.direction = TrendDirection::Improving;
    } else if (report.trendSlope < -kTrendThreshold) {
        report.direction = TrendDirection::Declining;
    }
    return report;
}

int consistencyScore(const TrendReport &report)
{
    if (report.days.empty()) {
        return 0;
    }

    int score = static_cast<int>(std::lround(report.averageCompletionRate * 60.0));
    if (report.direction == TrendDirection::Improving) {
        score += 20;
    } else if (report.direction == TrendDirection::Declining) {
        score = std::max(0, score - 10);
    }

    const auto highDays = std::count_if(report.days.begin(), report.days.end(), [](const DayPerformance &day) {
        return day.rate >= 0.8;
    });
    score += static_cast<int>(std::lround(static_cast<double>(highDays) / report.days.size() * 20.0));
    return std::clamp(score, 0, 100);
}

} // namespace services
} // namespace prayer
