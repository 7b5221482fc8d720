#pragma once

#include <QDate>
#include <QDateTime>
#include <QObject>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>

#include "prayer/data/DailyTimes.hpp"
#include "prayer/data/Location.hpp"
#include "prayer/data/Settings.hpp"
#include "prayer/services/NotificationSink.hpp"

namespace prayer {
namespace core {
class Clock;
}

namespace services {

class ScheduleCache;

// Keeps the pending prayer reminders in line with the settings. Every pass
// cancels the whole prayer id set before scheduling, so repeating a pass with
// the same settings leaves the same reminders behind. A newer pass discards
// the result of an older one that is still waiting for its times. At local
// midnight the latest pass runs again for the new day.
class NotificationOrchestrator : public QObject
{
    Q_OBJECT

public:
    using DoneCallback = std::function<void(bool)>;

    NotificationOrchestrator(ScheduleCache &cache,
                             NotificationSink &sink,
                             data::LocationSource &location,
                             const core::Clock &clock,
                             QObject *parent = nullptr);
    ~NotificationOrchestrator() override;

    // done(true) once the reminders are in place; done(false) when the times
    // could not be computed or a newer pass superseded this one.
    void recalculateAndReschedule(const data::Settings &settings, DoneCallback done = {});

    // Announces the new day and repeats the latest pass for it.
    void handleDayChange();
    bool isRolloverArmed() const;
    QDateTime nextRollover() const;

    void scheduleRemembrance(const data::Settings &settings);
    void cancelRemembrance();
    bool isRemembranceArmed() const;

    // Stops re-arming and the rollover, and discards passes still waiting for their times.
    void shutdown();

    static QDateTime offsettedTime(const QDateTime &base, int offsetMinutes);
    static ReminderRequest prayerReminder(data::PrayerId prayer, const QDateTime &time, const data::Settings &settings);
    static ReminderRequest remembranceReminder(const QDateTime &time);

signals:
    void rescheduled(int scheduledCount);
    void rescheduleFailed(const QString &message);
    void dayChanged(const QDate &date);

private:
    int applySchedule(const data::Settings &settings, const data::DailyTimes &times);
    void armRemembrance(int intervalHours);
    void onReminderFired(data::ReminderId id);
    void armRollover();
    void onRolloverTimeout();

    ScheduleCache &m_cache;
    NotificationSink &m_sink;
    data::LocationSource &m_location;
    const core::Clock &m_clock;
    quint64 m_generation = 0;
    std::optional<int> m_remembranceInterval;
    std::optional<data::Settings> m_lastSettings;
    QTimer m_rolloverTimer;
    QDateTime m_rolloverAt;
    bool m_shutdown = false;
    std::shared_ptr<bool> m_alive;
};

} // namespace services
} // namespace prayer
