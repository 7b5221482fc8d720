#include "prayer/data/TimetablePrayerCalculator.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTime>
#include <QTimer>
#include <utility>

#include "prayer/core/Logging.hpp"
#include "prayer/data/HijriDate.hpp"

namespace prayer {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto TIME_FORMAT = "HH:mm";
} // namespace

TimetablePrayerCalculator::TimetablePrayerCalculator(QString filePath, QObject *parent)
    : QObject(parent)
    , m_filePath(std::move(filePath))
{
}

void TimetablePrayerCalculator::compute(const CalculationRequest &request, TimesCallback done)
{
    TimesOutcome outcome = lookup(request);
    QTimer::singleShot(0, this, [done = std::move(done), outcome = std::move(outcome)]() {
        done(outcome);
    });
}

void TimetablePrayerCalculator::reload()
{
    m_loaded = false;
    m_days.clear();

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::PrayerDataError(QStringLiteral("Cannot open timetable %1: %2").arg(m_filePath, file.errorString()));
    }
    m_days = parseTimetable(file.readAll());
    m_loaded = true;
    qCInfo(core::lcCache) << "Timetable" << m_filePath << "provides" << m_days.size() << "days";
}

int TimetablePrayerCalculator::dayCount() const
{
    return static_cast<int>(m_days.size());
}

std::map<QDate, DailyTimes> TimetablePrayerCalculator::parseTimetable(const QByteArray &json)
{
    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        throw core::PrayerDataError(QStringLiteral("Malformed timetable: %1").arg(error.errorString()));
    }
    const QJsonValue daysValue = document.object().value(QStringLiteral("days"));
    if (!daysValue.isArray()) {
        throw core::PrayerDataError(QStringLiteral("Malformed timetable: missing \"days\" array"));
    }

    std::map<QDate, DailyTimes> days;
    for (const QJsonValue &value : daysValue.toArray()) {
        const QJsonObject day = value.toObject();
        const QDate date = QDate::fromString(day.value(QStringLiteral("date")).toString(), QLatin1String(DATE_FORMAT));
        if (!date.isValid()) {
            qCWarning(core::lcCache) << "Skipping timetable row without a valid date";
            continue;
        }

        DailyTimes times;
        times.date = date;
        times.hijri = hijriFromGregorian(date);
        for (PrayerId prayer : kAllPrayers) {
            const QTime time = QTime::fromString(day.value(prayerKey(prayer)).toString(), QLatin1String(TIME_FORMAT));
            if (time.isValid()) {
                times.times[indexOf(prayer)] = QDateTime(date, time);
            }
        }
        days[date] = times;
    }
    return days;
}

TimesOutcome TimetablePrayerCalculator::lookup(const CalculationRequest &request)
{
    if (!m_loaded) {
        try {
            reload();
        } catch (const core::PrayerDataError &error) {
            return TimesOutcome::failure(error.message());
        }
    }

    const auto it = m_days.find(request.date);
    if (it == m_days.end()) {
        return TimesOutcome::failure(
            QStringLiteral("Timetable has no entry for %1").arg(request.date.toString(QLatin1String(DATE_FORMAT))));
    }
    return TimesOutcome::success(it->second);
}

} // namespace data
} // namespace prayer
