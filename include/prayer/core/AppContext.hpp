#pragma once

#include <QDate>
#include <memory>

#include "prayer/core/AppConfig.hpp"

namespace prayer {
namespace data {
class DataProvider;
}

namespace services {
class CompletionTracker;
class NotificationOrchestrator;
class ScheduleCache;
class SettingsService;
class SettingsStore;
class TimerNotificationSink;
}

namespace viewmodels {
class PrayerStateViewModel;
}

namespace core {

class Clock;

// Composition root: owns every component and wires them together.
class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    void start();
    void shutdown();

    const AppConfig &config() const;
    const Clock &clock() const;
    data::DataProvider &dataProvider();
    services::ScheduleCache &scheduleCache();
    services::SettingsStore &settingsStore();
    services::SettingsService &settingsService();
    services::NotificationOrchestrator &orchestrator();
    services::CompletionTracker &completionTracker();
    viewmodels::PrayerStateViewModel &prayerState();

private:
    // Drops completion history past retention and cached times before today.
    void pruneStorage(const QDate &today);

    AppConfig m_config;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<services::TimerNotificationSink> m_sink;
    std::unique_ptr<services::ScheduleCache> m_cache;
    std::unique_ptr<services::SettingsStore> m_settingsStore;
    std::unique_ptr<services::NotificationOrchestrator> m_orchestrator;
    std::unique_ptr<services::SettingsService> m_settingsService;
    std::unique_ptr<services::CompletionTracker> m_completionTracker;
    std::unique_ptr<viewmodels::PrayerStateViewModel> m_prayerState;
    bool m_started = false;
};

} // namespace core
} // namespace prayer
