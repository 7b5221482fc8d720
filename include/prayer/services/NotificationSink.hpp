#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <vector>

#include "prayer/data/PrayerId.hpp"
#include "prayer/data/Settings.hpp"

namespace prayer {
namespace services {

struct ReminderRequest
{
    data::ReminderId id = data::ReminderId::Fajr;
    QString title;
    QString body;
    QDateTime time;
    data::SoundCategory sound = data::SoundCategory::Tone;
    QString soundFile;
};

// Delivers local reminders. Scheduling an id that is already pending replaces it.
// reminderFired is emitted whenever a reminder comes due, reminderDelivered only
// when it was actually shown.
class NotificationSink : public QObject
{
    Q_OBJECT

public:
    explicit NotificationSink(QObject *parent = nullptr);
    ~NotificationSink() override;

    virtual void schedule(const ReminderRequest &request) = 0;
    virtual void cancel(data::ReminderId id) = 0;
    virtual void cancelAll(const std::vector<data::ReminderId> &ids);
    virtual data::PermissionStatus permissionStatus() const = 0;

signals:
    void permissionStatusChanged(prayer::data::PermissionStatus status);
    void reminderFired(prayer::data::ReminderId id);
    void reminderDelivered(prayer::data::ReminderId id);
};

} // namespace services
} // namespace prayer

Q_DECLARE_METATYPE(prayer::services::ReminderRequest)
