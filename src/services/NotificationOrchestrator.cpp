#include "prayer/services/NotificationOrchestrator.hpp"

#include <QStringList>
#include <algorithm>
#include <limits>
#include <vector>

#include "prayer/core/Clock.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/services/LocationResolver.hpp"
#include "prayer/services/ScheduleCache.hpp"

namespace prayer {
namespace services {

namespace {

QStringList enabledPrayerNames(const data::Settings &settings)
{
    QStringList names;
    for (data::PrayerId prayer : data::kAllPrayers) {
        if (settings.notificationEnabled(prayer)) {
            names << data::prayerKey(prayer);
        }
    }
    return names;
}

} // namespace

NotificationOrchestrator::NotificationOrchestrator(ScheduleCache &cache,
                                                   NotificationSink &sink,
                                                   data::LocationSource &location,
                                                   const core::Clock &clock,
                                                   QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_sink(sink)
    , m_location(location)
    , m_clock(clock)
    , m_alive(std::make_shared<bool>(true))
{
    connect(&m_sink, &NotificationSink::reminderFired, this, &NotificationOrchestrator::onReminderFired);

    m_rolloverTimer.setSingleShot(true);
    m_rolloverTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_rolloverTimer, &QTimer::timeout, this, &NotificationOrchestrator::onRolloverTimeout);
}

NotificationOrchestrator::~NotificationOrchestrator() = default;

QDateTime NotificationOrchestrator::offsettedTime(const QDateTime &base, int offsetMinutes)
{
    return base.addSecs(static_cast<qint64>(offsetMinutes) * 60);
}

ReminderRequest NotificationOrchestrator::prayerReminder(data::PrayerId prayer,
                                                         const QDateTime &time,
                                                         const data::Settings &settings)
{
    const QString name = data::prayerDisplayName(prayer);

    ReminderRequest request;
    request.id = data::reminderIdFor(prayer);
    request.time = time;
    request.sound = data::soundCategoryFor(prayer);
    if (request.sound == data::SoundCategory::Adhan) {
        request.title = QStringLiteral("%1 Adhan").arg(name);
        request.soundFile = settings.azanSound;
    } else {
        request.title = QStringLiteral("%1 Prayer").arg(name);
    }
    request.body = QStringLiteral("Time for %1 prayer - %2").arg(name, time.toString(QStringLiteral("HH:mm")));
    return request;
}

ReminderRequest NotificationOrchestrator::remembranceReminder(const QDateTime &time)
{
    ReminderRequest request;
    request.id = data::ReminderId::Remembrance;
    request.title = QStringLiteral("Dhikr Reminder");
    request.body = QStringLiteral("Time for your dhikr. Remember Allah with a peaceful heart.");
    request.time = time;
    request.sound = data::SoundCategory::Tone;
    return request;
}

void NotificationOrchestrator::recalculateAndReschedule(const data::Settings &settings, DoneCallback done)
{
    if (m_shutdown) {
        if (done) {
            done(false);
        }
        return;
    }

    m_lastSettings = settings;
    armRollover();

    const quint64 generation = ++m_generation;
    const data::Coordinates location = resolveLocation(m_location);
    const QDate today = m_clock.now().date();

    std::weak_ptr<bool> alive = m_alive;
    m_cache.getOrCompute(
        today, location, settings.calculationMethod, settings.legalSchool,
        [this, alive, generation, settings, done](const data::TimesOutcome &outcome) {
            if (alive.expired()) {
                return;
            }
            if (m_shutdown || generation != m_generation) {
                qCDebug(core::lcNotify) << "Discarding superseded reschedule" << generation;
                if (done) {
                    done(false);
                }
                return;
            }

            if (!outcome.ok()) {
                const QString message = outcome.error->message();
                qCCritical(core::lcNotify) << "Rescheduling failed:" << message << "method" << settings.calculationMethod
                                           << "school" << settings.legalSchool << "enabled"
                                           << enabledPrayerNames(settings).join(QLatin1Char(','));
                emit rescheduleFailed(message);
                if (done) {
                    done(false);
                }
                return;
            }

            const int count = applySchedule(settings, *outcome.times);
            emit rescheduled(count);
            if (done) {
                done(true);
            }
        });
}

int NotificationOrchestrator::applySchedule(const data::Settings &settings, const data::DailyTimes &times)
{
    m_sink.cancelAll(std::vector<data::ReminderId>(data::kPrayerReminderIds.begin(), data::kPrayerReminderIds.end()));

    const QDateTime now = m_clock.now();
    int scheduled = 0;
    for (data::PrayerId prayer : data::kAllPrayers) {
        if (!settings.notificationEnabled(prayer)) {
            continue;
        }
        const auto base = times.timeFor(prayer);
        if (!base) {
            qCWarning(core::lcNotify) << "No time for" << data::prayerKey(prayer) << ", skipping its reminder";
            continue;
        }
        const QDateTime at = offsettedTime(*base, settings.offsetFor(prayer));
        if (at <= now) {
            continue;
        }
        m_sink.schedule(prayerReminder(prayer, at, settings));
        ++scheduled;
    }
    qCInfo(core::lcNotify) << "Scheduled" << scheduled << "prayer reminders for" << times.date.toString(Qt::ISODate);
    return scheduled;
}

void NotificationOrchestrator::scheduleRemembrance(const data::Settings &settings)
{
    if (m_shutdown) {
        return;
    }
    const int interval = std::clamp(settings.reminderIntervalHours, data::kMinReminderIntervalHours,
                                    data::kMaxReminderIntervalHours);
    m_remembranceInterval = interval;
    armRemembrance(interval);
}

void NotificationOrchestrator::cancelRemembrance()
{
    m_remembranceInterval.reset();
    m_sink.cancel(data::ReminderId::Remembrance);
    qCInfo(core::lcNotify) << "Remembrance reminders cancelled";
}

bool NotificationOrchestrator::isRemembranceArmed() const
{
    return m_remembranceInterval.has_value();
}

void NotificationOrchestrator::shutdown()
{
    m_shutdown = true;
    ++m_generation;
    m_remembranceInterval.reset();
    m_rolloverTimer.stop();
}

void NotificationOrchestrator::armRemembrance(int intervalHours)
{
    const QDateTime at = m_clock.now().addSecs(static_cast<qint64>(intervalHours) * 3600);
    m_sink.cancel(data::ReminderId::Remembrance);
    m_sink.schedule(remembranceReminder(at));
    qCInfo(core::lcNotify) << "Next remembrance reminder at" << at.toString(Qt::ISODate);
}

void NotificationOrchestrator::onReminderFired(data::ReminderId id)
{
    if (id != data::ReminderId::Remembrance || m_shutdown || !m_remembranceInterval) {
        return;
    }
    armRemembrance(*m_remembranceInterval);
}

void NotificationOrchestrator::handleDayChange()
{
    if (m_shutdown) {
        return;
    }
    const QDate today = m_clock.now().date();
    qCInfo(core::lcNotify) << "Day changed to" << today.toString(Qt::ISODate);
    emit dayChanged(today);
    if (m_lastSettings) {
        recalculateAndReschedule(*m_lastSettings);
    } else {
        armRollover();
    }
}

bool NotificationOrchestrator::isRolloverArmed() const
{
    return m_rolloverTimer.isActive();
}

QDateTime NotificationOrchestrator::nextRollover() const
{
    return m_rolloverAt;
}

void NotificationOrchestrator::armRollover()
{
    const QDateTime now = m_clock.now();
    m_rolloverAt = QDateTime(now.date().addDays(1), QTime(0, 0));
    const qint64 delay = std::max<qint64>(0, now.msecsTo(m_rolloverAt));
    m_rolloverTimer.start(static_cast<int>(std::min<qint64>(delay, std::numeric_limits<int>::max())));
}

void NotificationOrchestrator::onRolloverTimeout()
{
    const QDateTime now = m_clock.now();
    if (now < m_rolloverAt) {
        const qint64 remaining = now.msecsTo(m_rolloverAt);
        m_rolloverTimer.start(static_cast<int>(std::min<qint64>(remaining, std::numeric_limits<int>::max())));
        return;
    }
    handleDayChange();
}

} // namespace services
} // namespace prayer
