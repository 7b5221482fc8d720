#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

#include "prayer/data/Settings.hpp"
#include "prayer/services/SettingsStore.hpp"

namespace prayer {
namespace services {

class NotificationOrchestrator;
class NotificationSink;

// Domain setters over the settings store. Each setter picks its persistence
// discipline and triggers the reminder follow-up it needs; setting a value
// that is already current does nothing.
class SettingsService : public QObject
{
    Q_OBJECT

public:
    using UpdateOutcome = SettingsStore::UpdateOutcome;

    SettingsService(SettingsStore &store,
                    NotificationOrchestrator &orchestrator,
                    NotificationSink &sink,
                    QObject *parent = nullptr);

    const data::Settings &settings() const;

    UpdateOutcome setCalculationMethod(const QString &method);
    UpdateOutcome setLegalSchool(const QString &school);
    UpdateOutcome setPrayerOffset(data::PrayerId prayer, int minutes);
    // Enabling is refused (returns Unchanged) while notifications are blocked.
    UpdateOutcome setPrayerNotification(data::PrayerId prayer, bool enabled);
    UpdateOutcome setAllPrayerNotifications(bool enabled);
    UpdateOutcome setAzanSound(const QString &sound);
    UpdateOutcome setLanguage(const QString &language);
    UpdateOutcome setThemeMode(data::ThemeMode mode);
    UpdateOutcome setTimeFormat(data::TimeFormat format);
    UpdateOutcome setDateFormat(data::DateFormatOption format);
    UpdateOutcome setRemembranceEnabled(bool enabled);
    UpdateOutcome setRemembranceInterval(int hours);

    bool resetToDefaults();
    QByteArray exportSettings() const;
    bool importSettings(const QByteArray &json);

    // Brings prayer and remembrance reminders in line with the current settings.
    void applyReminders();

private:
    void onPermissionStatusChanged(data::PermissionStatus status);
    UpdateOutcome update(const SettingsStore::Setter &setter, SettingsStore::Persistence mode, bool reschedule);
    void reschedulePrayers();
    void syncRemembrance();

    SettingsStore &m_store;
    NotificationOrchestrator &m_orchestrator;
    NotificationSink &m_sink;
};

} // namespace services
} // namespace prayer
