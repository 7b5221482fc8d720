#pragma once

#include <QString>
#include <stdexcept>

namespace prayer {
namespace core {

enum class ErrorKind
{
    PrayerData,
    LocationService,
    Persistence,
};

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const QString &message);

    ErrorKind kind() const;
    QString message() const;

private:
    ErrorKind m_kind;
};

// Calculator failure or malformed cached prayer data.
class PrayerDataError : public Error
{
public:
    explicit PrayerDataError(const QString &message);
};

class LocationServiceError : public Error
{
public:
    explicit LocationServiceError(const QString &message, QString cause = {});

    const QString &cause() const;

private:
    QString m_cause;
};

class PersistenceError : public Error
{
public:
    PersistenceError(const QString &message, QString key);

    const QString &key() const;

private:
    QString m_key;
};

} // namespace core
} // namespace prayer
