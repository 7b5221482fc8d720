#include "prayer/core/AppContext.hpp"

#include <QDate>
#include <QObject>
#include <utility>

#include "prayer/core/Clock.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/DataProvider.hpp"
#include "prayer/services/CompletionTracker.hpp"
#include "prayer/services/NotificationOrchestrator.hpp"
#include "prayer/services/ScheduleCache.hpp"
#include "prayer/services/SettingsService.hpp"
#include "prayer/services/SettingsStore.hpp"
#include "prayer/services/TimerNotificationSink.hpp"
#include "prayer/viewmodels/PrayerStateViewModel.hpp"

namespace prayer {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_clock(std::make_unique<SystemClock>())
    , m_dataProvider(std::make_unique<data::DataProvider>(m_config))
{
    m_sink = std::make_unique<services::TimerNotificationSink>(*m_clock);
    m_cache = std::make_unique<services::ScheduleCache>(m_dataProvider->store(),
                                                        m_dataProvider->calculator(),
                                                        *m_clock,
                                                        m_config.cacheLifetime);
    m_settingsStore = std::make_unique<services::SettingsStore>(m_dataProvider->store(),
                                                                m_config.saveDebounce,
                                                                m_config.saveRetryDelay);
    m_orchestrator = std::make_unique<services::NotificationOrchestrator>(*m_cache,
                                                                          *m_sink,
                                                                          m_dataProvider->locationSource(),
                                                                          *m_clock);
    m_settingsService = std::make_unique<services::SettingsService>(*m_settingsStore, *m_orchestrator, *m_sink);
    m_completionTracker = std::make_unique<services::CompletionTracker>(m_dataProvider->store(), *m_clock);
    m_prayerState = std::make_unique<viewmodels::PrayerStateViewModel>(*m_settingsStore,
                                                                       *m_cache,
                                                                       m_dataProvider->locationSource(),
                                                                       *m_clock);
}

AppContext::~AppContext()
{
    shutdown();
}

void AppContext::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    QObject::connect(m_settingsStore.get(), &services::SettingsStore::loaded, m_settingsService.get(), [this]() {
        m_settingsService->applyReminders();
        pruneStorage(m_clock->now().date());
    });
    QObject::connect(m_orchestrator.get(), &services::NotificationOrchestrator::dayChanged,
                     m_completionTracker.get(), [this](const QDate &today) { pruneStorage(today); });
    m_settingsStore->initialize();
    m_prayerState->start(m_config.pollInterval);
    qCInfo(lcApp) << "Started with store" << m_config.storagePath;
}

void AppContext::shutdown()
{
    if (!m_started) {
        return;
    }
    m_started = false;
    m_prayerState->stop();
    m_orchestrator->shutdown();
    m_settingsStore->shutdown();
    qCInfo(lcApp) << "Shut down";
}

void AppContext::pruneStorage(const QDate &today)
{
    m_completionTracker->cleanOldHistory(m_config.historyRetentionDays);
    m_cache->pruneBefore(today);
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

const Clock &AppContext::clock() const
{
    return *m_clock;
}

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

services::ScheduleCache &AppContext::scheduleCache()
{
    return *m_cache;
}

services::SettingsStore &AppContext::settingsStore()
{
    return *m_settingsStore;
}

services::SettingsService &AppContext::settingsService()
{
    return *m_settingsService;
}

services::NotificationOrchestrator &AppContext::orchestrator()
{
    return *m_orchestrator;
}

services::CompletionTracker &AppContext::completionTracker()
{
    return *m_completionTracker;
}

viewmodels::PrayerStateViewModel &AppContext::prayerState()
{
    return *m_prayerState;
}

} // namespace core
} // namespace prayer
