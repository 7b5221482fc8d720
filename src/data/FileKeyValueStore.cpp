#include "prayer/data/FileKeyValueStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <utility>

#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"

namespace prayer {
namespace data {

FileKeyValueStore::FileKeyValueStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

void FileKeyValueStore::open()
{
    m_values.clear();
    m_open = false;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(core::lcStore) << "Starting with an empty store at" << m_filePath;
        m_open = true;
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::PersistenceError(QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()), {});
    }

    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(core::lcStore) << "Discarding unreadable store" << m_filePath << error.errorString();
        m_open = true;
        return;
    }

    const QJsonObject object = document.object();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        m_values.insert(it.key(), it.value().toString().toUtf8());
    }
    m_open = true;
    qCDebug(core::lcStore) << "Loaded" << m_values.size() << "keys from" << m_filePath;
}

const QString &FileKeyValueStore::filePath() const
{
    return m_filePath;
}

std::optional<QByteArray> FileKeyValueStore::get(const QString &key) const
{
    ensureOpen(key);
    if (m_values.contains(key)) {
        return m_values.value(key);
    }
    return std::nullopt;
}

void FileKeyValueStore::set(const QString &key, const QByteArray &value)
{
    ensureOpen(key);
    QHash<QString, QByteArray> next = m_values;
    next.insert(key, value);
    save(next, key);
    m_values = std::move(next);
}

bool FileKeyValueStore::remove(const QString &key)
{
    ensureOpen(key);
    if (!m_values.contains(key)) {
        return false;
    }
    QHash<QString, QByteArray> next = m_values;
    next.remove(key);
    save(next, key);
    m_values = std::move(next);
    return true;
}

QStringList FileKeyValueStore::keys(const QString &prefix) const
{
    ensureOpen(prefix);
    QStringList result;
    for (auto it = m_values.constBegin(); it != m_values.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            result << it.key();
        }
    }
    result.sort();
    return result;
}

bool FileKeyValueStore::isReady() const
{
    return m_open;
}

void FileKeyValueStore::ensureOpen(const QString &key) const
{
    if (!m_open) {
        throw core::PersistenceError(QStringLiteral("Store %1 is not open").arg(m_filePath), key);
    }
}

void FileKeyValueStore::save(const QHash<QString, QByteArray> &values, const QString &key) const
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::PersistenceError(QStringLiteral("Cannot create %1").arg(dir.path()), key);
    }

    QJsonObject object;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        object.insert(it.key(), QString::fromUtf8(it.value()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw core::PersistenceError(QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()), key);
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        throw core::PersistenceError(QStringLiteral("Cannot commit %1: %2").arg(m_filePath, file.errorString()), key);
    }
}

} // namespace data
} // namespace prayer
