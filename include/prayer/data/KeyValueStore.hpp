#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>

namespace prayer {
namespace data {

// Byte-oriented persistence. Implementations throw core::PersistenceError
// when the backing medium cannot be read or written.
class KeyValueStore
{
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<QByteArray> get(const QString &key) const = 0;
    virtual void set(const QString &key, const QByteArray &value) = 0;
    virtual bool remove(const QString &key) = 0;
    virtual QStringList keys(const QString &prefix = {}) const = 0;

    // False while the backing medium has not been opened yet.
    virtual bool isReady() const { return true; }
};

} // namespace data
} // namespace prayer
