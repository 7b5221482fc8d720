#include "prayer/services/SettingsService.hpp"

#include <algorithm>

#include "prayer/core/Logging.hpp"
#include "prayer/data/JsonCodec.hpp"
#include "prayer/services/NotificationOrchestrator.hpp"
#include "prayer/services/NotificationSink.hpp"

namespace prayer {
namespace services {

using Persistence = SettingsStore::Persistence;

SettingsService::SettingsService(SettingsStore &store,
                                 NotificationOrchestrator &orchestrator,
                                 NotificationSink &sink,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_orchestrator(orchestrator)
    , m_sink(sink)
{
    connect(&m_sink, &NotificationSink::permissionStatusChanged, this, &SettingsService::onPermissionStatusChanged);
}

const data::Settings &SettingsService::settings() const
{
    return m_store.settings();
}

SettingsService::UpdateOutcome SettingsService::setCalculationMethod(const QString &method)
{
    return update([&method](data::Settings &s) { s.calculationMethod = method; }, Persistence::Immediate, true);
}

SettingsService::UpdateOutcome SettingsService::setLegalSchool(const QString &school)
{
    return update([&school](data::Settings &s) { s.legalSchool = school; }, Persistence::Immediate, true);
}

SettingsService::UpdateOutcome SettingsService::setPrayerOffset(data::PrayerId prayer, int minutes)
{
    const int clamped = std::clamp(minutes, -data::kMaxOffsetMinutes, data::kMaxOffsetMinutes);
    return update([prayer, clamped](data::Settings &s) { s.offsetMinutes[data::indexOf(prayer)] = clamped; },
                  Persistence::Immediate,
                  true);
}

SettingsService::UpdateOutcome SettingsService::setPrayerNotification(data::PrayerId prayer, bool enabled)
{
    if (enabled && data::isBlocked(m_sink.permissionStatus())) {
        qCWarning(core::lcSettings) << "Notifications are blocked, not enabling" << data::prayerKey(prayer);
        return UpdateOutcome::Unchanged;
    }
    return update([prayer, enabled](data::Settings &s) { s.notificationsEnabled[data::indexOf(prayer)] = enabled; },
                  Persistence::Immediate,
                  true);
}

SettingsService::UpdateOutcome SettingsService::setAllPrayerNotifications(bool enabled)
{
    if (enabled && data::isBlocked(m_sink.permissionStatus())) {
        qCWarning(core::lcSettings) << "Notifications are blocked, not enabling prayer reminders";
        return UpdateOutcome::Unchanged;
    }
    return update([enabled](data::Settings &s) { s.notificationsEnabled.fill(enabled); }, Persistence::Immediate, true);
}

SettingsService::UpdateOutcome SettingsService::setAzanSound(const QString &sound)
{
    return update([&sound](data::Settings &s) { s.azanSound = sound; }, Persistence::Immediate, true);
}

SettingsService::UpdateOutcome SettingsService::setLanguage(const QString &language)
{
    return update([&language](data::Settings &s) { s.language = language; }, Persistence::Immediate, false);
}

SettingsService::UpdateOutcome SettingsService::setThemeMode(data::ThemeMode mode)
{
    return update([mode](data::Settings &s) { s.themeMode = mode; }, Persistence::Debounced, false);
}

SettingsService::UpdateOutcome SettingsService::setTimeFormat(data::TimeFormat format)
{
    return update([format](data::Settings &s) { s.timeFormat = format; }, Persistence::Debounced, false);
}

SettingsService::UpdateOutcome SettingsService::setDateFormat(data::DateFormatOption format)
{
    return update([format](data::Settings &s) { s.dateFormat = format; }, Persistence::Debounced, false);
}

SettingsService::UpdateOutcome SettingsService::setRemembranceEnabled(bool enabled)
{
    const UpdateOutcome outcome =
        update([enabled](data::Settings &s) { s.remembranceEnabled = enabled; }, Persistence::Immediate, false);
    if (outcome != UpdateOutcome::Unchanged) {
        syncRemembrance();
    }
    return outcome;
}

SettingsService::UpdateOutcome SettingsService::setRemembranceInterval(int hours)
{
    const int clamped = std::clamp(hours, data::kMinReminderIntervalHours, data::kMaxReminderIntervalHours);
    const UpdateOutcome outcome =
        update([clamped](data::Settings &s) { s.reminderIntervalHours = clamped; }, Persistence::Immediate, false);
    if (outcome != UpdateOutcome::Unchanged && m_store.settings().remembranceEnabled) {
        syncRemembrance();
    }
    return outcome;
}

bool SettingsService::resetToDefaults()
{
    data::Settings defaults;
    defaults.permissionStatus = m_store.settings().permissionStatus;
    const bool persisted = m_store.save(defaults);
    qCInfo(core::lcSettings) << "Settings reset to defaults";
    reschedulePrayers();
    m_orchestrator.cancelRemembrance();
    return persisted;
}

QByteArray SettingsService::exportSettings() const
{
    return data::encodeSettings(m_store.settings());
}

bool SettingsService::importSettings(const QByteArray &json)
{
    const auto imported = data::decodeSettings(json);
    if (!imported) {
        qCWarning(core::lcSettings) << "Rejected settings import: not a JSON object";
        return false;
    }
    m_store.save(*imported);
    qCInfo(core::lcSettings) << "Settings imported";
    reschedulePrayers();
    syncRemembrance();
    return true;
}

void SettingsService::applyReminders()
{
    reschedulePrayers();
    syncRemembrance();
}

void SettingsService::onPermissionStatusChanged(data::PermissionStatus status)
{
    qCInfo(core::lcSettings) << "Notification permission is now" << data::permissionStatusKey(status);
    const bool wasBlocked = data::isBlocked(m_store.settings().permissionStatus);
    update([status](data::Settings &s) { s.permissionStatus = status; }, Persistence::Debounced, false);
    if (wasBlocked && !data::isBlocked(status) && m_store.settings().remembranceEnabled) {
        syncRemembrance();
    }
}

SettingsService::UpdateOutcome SettingsService::update(const SettingsStore::Setter &setter,
                                                       SettingsStore::Persistence mode,
                                                       bool reschedule)
{
    const UpdateOutcome outcome = m_store.updateField(setter, mode);
    if (outcome == UpdateOutcome::WriteFailed) {
        qCWarning(core::lcSettings) << "Setting kept in memory only until the next successful write";
    }
    if (reschedule && outcome != UpdateOutcome::Unchanged) {
        reschedulePrayers();
    }
    return outcome;
}

void SettingsService::reschedulePrayers()
{
    m_orchestrator.recalculateAndReschedule(m_store.settings());
}

void SettingsService::syncRemembrance()
{
    if (m_store.settings().remembranceEnabled) {
        m_orchestrator.scheduleRemembrance(m_store.settings());
    } else {
        m_orchestrator.cancelRemembrance();
    }
}

} // namespace services
} // namespace prayer
