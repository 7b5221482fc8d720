#pragma once

#include <QHash>

#include "prayer/data/KeyValueStore.hpp"

namespace prayer {
namespace data {

class InMemoryKeyValueStore : public KeyValueStore
{
public:
    InMemoryKeyValueStore();
    ~InMemoryKeyValueStore() override;

    std::optional<QByteArray> get(const QString &key) const override;
    void set(const QString &key, const QByteArray &value) override;
    bool remove(const QString &key) override;
    QStringList keys(const QString &prefix = {}) const override;

private:
    QHash<QString, QByteArray> m_values;
};

} // namespace data
} // namespace prayer
