#pragma once

#include <QObject>
#include <QString>
#include <map>

#include "prayer/data/PrayerCalculator.hpp"

namespace prayer {
namespace data {

// Serves prayer times from a published timetable file of the form
// {"days": [{"date": "yyyy-MM-dd", "fajr": "HH:mm", ...}]}. The timetable is
// read on first use; results are delivered on the next event-loop turn.
class TimetablePrayerCalculator : public QObject, public PrayerCalculator
{
    Q_OBJECT

public:
    explicit TimetablePrayerCalculator(QString filePath, QObject *parent = nullptr);

    void compute(const CalculationRequest &request, TimesCallback done) override;

    // Throws core::PrayerDataError when the file is missing or malformed.
    void reload();
    int dayCount() const;

    static std::map<QDate, DailyTimes> parseTimetable(const QByteArray &json);

private:
    TimesOutcome lookup(const CalculationRequest &request);

    QString m_filePath;
    std::map<QDate, DailyTimes> m_days;
    bool m_loaded = false;
};

} // namespace data
} // namespace prayer
