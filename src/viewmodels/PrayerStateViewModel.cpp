#include "prayer/viewmodels/PrayerStateViewModel.hpp"

#include "prayer/core/Clock.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/services/LocationResolver.hpp"
#include "prayer/services/ScheduleCache.hpp"
#include "prayer/services/SettingsStore.hpp"

namespace prayer {
namespace viewmodels {

bool operator==(const PrayerState &lhs, const PrayerState &rhs)
{
    return lhs.currentPrayer == rhs.currentPrayer && lhs.nextPrayer == rhs.nextPrayer
        && lhs.nextPrayerTime == rhs.nextPrayerTime;
}

bool operator!=(const PrayerState &lhs, const PrayerState &rhs)
{
    return !(lhs == rhs);
}

PrayerState deriveState(const data::DailyTimes &times, const QDateTime &now)
{
    PrayerState state;
    state.currentPrayer = times.currentPrayer(now);
    if (const auto next = times.nextPrayer(now)) {
        state.nextPrayer = next->prayer;
        state.nextPrayerTime = next->time;
    }
    return state;
}

PrayerStateViewModel::PrayerStateViewModel(services::SettingsStore &settings,
                                           services::ScheduleCache &cache,
                                           data::LocationSource &location,
                                           const core::Clock &clock,
                                           QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_cache(cache)
    , m_location(location)
    , m_clock(clock)
    , m_alive(std::make_shared<bool>(true))
{
    connect(&m_timer, &QTimer::timeout, this, &PrayerStateViewModel::refresh);
}

PrayerStateViewModel::~PrayerStateViewModel()
{
    m_timer.stop();
}

void PrayerStateViewModel::start(std::chrono::milliseconds interval)
{
    m_timer.setInterval(interval);
    m_timer.start();
    refresh();
}

void PrayerStateViewModel::stop()
{
    m_timer.stop();
    ++m_generation;
    m_refreshing = false;
}

void PrayerStateViewModel::refresh()
{
    if (m_refreshing) {
        qCDebug(core::lcState) << "Refresh still in flight, skipping tick";
        return;
    }
    m_refreshing = true;

    const quint64 generation = ++m_generation;
    const data::Settings settings = m_settings.settings();
    const data::Coordinates location = services::resolveLocation(m_location);

    std::weak_ptr<bool> alive = m_alive;
    m_cache.getOrCompute(
        m_clock.now().date(), location, settings.calculationMethod, settings.legalSchool,
        [this, alive, generation, offsets = settings.offsetMinutes](const data::TimesOutcome &outcome) {
            if (alive.expired() || generation != m_generation) {
                return;
            }
            m_refreshing = false;

            if (!outcome.ok()) {
                qCWarning(core::lcState) << "Keeping last prayer state:" << outcome.error->message();
                emit refreshFailed(outcome.error->message());
                return;
            }
            publish(deriveState(outcome.times->withOffsets(offsets), m_clock.now()));
        });
}

const PrayerState &PrayerStateViewModel::state() const
{
    return m_state;
}

bool PrayerStateViewModel::isRefreshing() const
{
    return m_refreshing;
}

bool PrayerStateViewModel::isRunning() const
{
    return m_timer.isActive();
}

void PrayerStateViewModel::publish(const PrayerState &state)
{
    if (state == m_state) {
        return;
    }
    m_state = state;
    qCDebug(core::lcState) << "Current" << (m_state.currentPrayer ? data::prayerKey(*m_state.currentPrayer) : QString())
                           << "next" << (m_state.nextPrayer ? data::prayerKey(*m_state.nextPrayer) : QString());
    emit stateChanged(m_state);
}

} // namespace viewmodels
} // namespace prayer
