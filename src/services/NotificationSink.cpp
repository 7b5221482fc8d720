#include "prayer/services/NotificationSink.hpp"

namespace prayer {
namespace services {

NotificationSink::NotificationSink(QObject *parent)
    : QObject(parent)
{
}

NotificationSink::~NotificationSink() = default;

void NotificationSink::cancelAll(const std::vector<data::ReminderId> &ids)
{
    for (data::ReminderId id : ids) {
        cancel(id);
    }
}

} // namespace services
} // namespace prayer
