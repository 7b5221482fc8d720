#include "prayer/core/Errors.hpp"

#include <utility>

namespace prayer {
namespace core {

Error::Error(ErrorKind kind, const QString &message)
    : std::runtime_error(message.toStdString())
    , m_kind(kind)
{
}

ErrorKind Error::kind() const
{
    return m_kind;
}

QString Error::message() const
{
    return QString::fromStdString(what());
}

PrayerDataError::PrayerDataError(const QString &message)
    : Error(ErrorKind::PrayerData, message)
{
}

LocationServiceError::LocationServiceError(const QString &message, QString cause)
    : Error(ErrorKind::LocationService, message)
    , m_cause(std::move(cause))
{
}

const QString &LocationServiceError::cause() const
{
    return m_cause;
}

PersistenceError::PersistenceError(const QString &message, QString key)
    : Error(ErrorKind::Persistence, message)
    , m_key(std::move(key))
{
}

const QString &PersistenceError::key() const
{
    return m_key;
}

} // namespace core
} // namespace prayer
