#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>

#include "prayer/data/DailyTimes.hpp"
#include "prayer/data/PrayerId.hpp"

namespace prayer {
namespace core {
class Clock;
}

namespace data {
class LocationSource;
}

namespace services {
class ScheduleCache;
class SettingsStore;
}

namespace viewmodels {

struct PrayerState
{
    std::optional<data::PrayerId> currentPrayer;
    std::optional<data::PrayerId> nextPrayer;
    std::optional<QDateTime> nextPrayerTime;
};

bool operator==(const PrayerState &lhs, const PrayerState &rhs);
bool operator!=(const PrayerState &lhs, const PrayerState &rhs);

PrayerState deriveState(const data::DailyTimes &times, const QDateTime &now);

// Current and next prayer, refreshed on a fixed tick. Listeners only hear
// about a new state when it differs from the last published one.
class PrayerStateViewModel : public QObject
{
    Q_OBJECT

public:
    PrayerStateViewModel(services::SettingsStore &settings,
                         services::ScheduleCache &cache,
                         data::LocationSource &location,
                         const core::Clock &clock,
                         QObject *parent = nullptr);
    ~PrayerStateViewModel() override;

    void start(std::chrono::milliseconds interval = std::chrono::minutes(1));
    void stop();
    void refresh();

    const PrayerState &state() const;
    bool isRefreshing() const;
    bool isRunning() const;

signals:
    void stateChanged(const prayer::viewmodels::PrayerState &state);
    void refreshFailed(const QString &message);

private:
    void publish(const PrayerState &state);

    services::SettingsStore &m_settings;
    services::ScheduleCache &m_cache;
    data::LocationSource &m_location;
    const core::Clock &m_clock;
    QTimer m_timer;
    PrayerState m_state;
    quint64 m_generation = 0;
    bool m_refreshing = false;
    std::shared_ptr<bool> m_alive;
};

} // namespace viewmodels
} // namespace prayer

Q_DECLARE_METATYPE(prayer::viewmodels::PrayerState)
