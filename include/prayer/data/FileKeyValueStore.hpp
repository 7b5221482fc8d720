#pragma once

#include <QHash>
#include <QString>

#include "prayer/data/KeyValueStore.hpp"

namespace prayer {
namespace data {

// Keeps every key in one JSON object file. Each mutation rewrites the file
// atomically; the in-memory copy only changes once the write committed.
class FileKeyValueStore : public KeyValueStore
{
public:
    explicit FileKeyValueStore(QString filePath);
    ~FileKeyValueStore() override = default;

    // Reads the file. A missing file is an empty store; an unparsable one is
    // logged and replaced on the next write.
    void open();

    const QString &filePath() const;

    std::optional<QByteArray> get(const QString &key) const override;
    void set(const QString &key, const QByteArray &value) override;
    bool remove(const QString &key) override;
    QStringList keys(const QString &prefix = {}) const override;
    bool isReady() const override;

private:
    void ensureOpen(const QString &key) const;
    void save(const QHash<QString, QByteArray> &values, const QString &key) const;

    QString m_filePath;
    QHash<QString, QByteArray> m_values;
    bool m_open = false;
};

} // namespace data
} // namespace prayer
