#include "prayer/data/InMemoryKeyValueStore.hpp"

namespace prayer {
namespace data {

InMemoryKeyValueStore::InMemoryKeyValueStore() = default;
InMemoryKeyValueStore::~InMemoryKeyValueStore() = default;

std::optional<QByteArray> InMemoryKeyValueStore::get(const QString &key) const
{
    if (m_values.contains(key)) {
        return m_values.value(key);
    }
    return std::nullopt;
}

void InMemoryKeyValueStore::set(const QString &key, const QByteArray &value)
{
    m_values.insert(key, value);
}

bool InMemoryKeyValueStore::remove(const QString &key)
{
    return m_values.remove(key) > 0;
}

QStringList InMemoryKeyValueStore::keys(const QString &prefix) const
{
    QStringList result;
    for (auto it = m_values.constBegin(); it != m_values.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            result << it.key();
        }
    }
    result.sort();
    return result;
}

} // namespace data
} // namespace prayer
