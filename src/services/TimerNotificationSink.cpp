#include "prayer/services/TimerNotificationSink.hpp"

#include <algorithm>
#include <limits>

#include "prayer/core/Clock.hpp"
#include "prayer/core/Logging.hpp"

namespace prayer {
namespace services {

TimerNotificationSink::TimerNotificationSink(const core::Clock &clock, QObject *parent)
    : NotificationSink(parent)
    , m_clock(clock)
{
}

TimerNotificationSink::~TimerNotificationSink() = default;

void TimerNotificationSink::schedule(const ReminderRequest &request)
{
    cancel(request.id);

    const qint64 delay = std::max<qint64>(0, m_clock.now().msecsTo(request.time));
    auto timer = std::make_unique<QTimer>();
    timer->setSingleShot(true);
    timer->setTimerType(Qt::CoarseTimer);
    const data::ReminderId id = request.id;
    connect(timer.get(), &QTimer::timeout, this, [this, id]() { deliver(id); });
    // QTimer intervals are int milliseconds; long waits are re-armed on expiry.
    timer->start(static_cast<int>(std::min<qint64>(delay, std::numeric_limits<int>::max())));

    qCDebug(core::lcNotify) << "Scheduled reminder" << static_cast<int>(id) << request.title << "at"
                            << request.time.toString(Qt::ISODate);
    m_pending[id] = Pending{ request, std::move(timer) };
}

void TimerNotificationSink::cancel(data::ReminderId id)
{
    m_pending.erase(id);
}

data::PermissionStatus TimerNotificationSink::permissionStatus() const
{
    return m_permission;
}

void TimerNotificationSink::setPermissionStatus(data::PermissionStatus status)
{
    if (m_permission == status) {
        return;
    }
    m_permission = status;
    emit permissionStatusChanged(status);
}

bool TimerNotificationSink::isPending(data::ReminderId id) const
{
    return m_pending.count(id) > 0;
}

std::size_t TimerNotificationSink::pendingCount() const
{
    return m_pending.size();
}

void TimerNotificationSink::deliver(data::ReminderId id)
{
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return;
    }
    if (m_clock.now() < it->second.request.time) {
        const qint64 remaining = m_clock.now().msecsTo(it->second.request.time);
        it->second.timer->start(static_cast<int>(std::min<qint64>(remaining, std::numeric_limits<int>::max())));
        return;
    }

    const ReminderRequest request = it->second.request;
    it->second.timer.release()->deleteLater();
    m_pending.erase(it);

    emit reminderFired(id);
    if (data::isBlocked(m_permission)) {
        qCInfo(core::lcNotify) << "Suppressed reminder" << request.title << "(notifications blocked)";
        return;
    }
    qCInfo(core::lcNotify).noquote() << request.title << "-" << request.body;
    emit reminderDelivered(id);
}

} // namespace services
} // namespace prayer
