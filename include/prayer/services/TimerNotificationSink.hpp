#pragma once

#include <QTimer>
#include <map>
#include <memory>

#include "prayer/services/NotificationSink.hpp"

namespace prayer {
namespace core {
class Clock;
}

namespace services {

// In-process sink: each pending reminder is a single-shot timer that logs the
// reminder when it fires.
class TimerNotificationSink : public NotificationSink
{
    Q_OBJECT

public:
    explicit TimerNotificationSink(const core::Clock &clock, QObject *parent = nullptr);
    ~TimerNotificationSink() override;

    void schedule(const ReminderRequest &request) override;
    void cancel(data::ReminderId id) override;
    data::PermissionStatus permissionStatus() const override;

    void setPermissionStatus(data::PermissionStatus status);
    bool isPending(data::ReminderId id) const;
    std::size_t pendingCount() const;

private:
    void deliver(data::ReminderId id);

    struct Pending
    {
        ReminderRequest request;
        std::unique_ptr<QTimer> timer;
    };

    const core::Clock &m_clock;
    std::map<data::ReminderId, Pending> m_pending;
    data::PermissionStatus m_permission = data::PermissionStatus::Granted;
};

} // namespace services
} // namespace prayer
