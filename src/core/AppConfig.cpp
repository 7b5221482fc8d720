#include "prayer/core/AppConfig.hpp"

#include "prayer/core/Logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace prayer {
namespace core {

namespace {

std::optional<double> readCoordinate(const QSettings &settings, const QString &key)
{
    if (!settings.contains(key)) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok) {
        qCWarning(lcApp) << "Ignoring non-numeric config value" << key << settings.value(key);
        return std::nullopt;
    }
    return value;
}

template <typename Duration>
Duration readDuration(const QSettings &settings, const QString &key, Duration fallback)
{
    bool ok = false;
    const qint64 value = settings.value(key, static_cast<qint64>(fallback.count())).toLongLong(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcApp) << "Ignoring invalid duration" << key << settings.value(key);
        return fallback;
    }
    return Duration(value);
}

int readPositiveInt(const QSettings &settings, const QString &key, int fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcApp) << "Ignoring invalid value" << key << settings.value(key);
        return fallback;
    }
    return value;
}

} // namespace

QString defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/prayer-keeper");
    }
    return QDir(storageFolder).filePath(QStringLiteral("store.json"));
}

AppConfig loadConfig(const QString &iniPath)
{
    AppConfig config;
    config.storagePath = defaultStoragePath();
    if (iniPath.isEmpty()) {
        return config;
    }
    if (!QFileInfo::exists(iniPath)) {
        qCWarning(lcApp) << "Config file" << iniPath << "not found, using defaults";
        return config;
    }

    QSettings settings(iniPath, QSettings::IniFormat);
    config.storagePath = settings.value(QStringLiteral("storage/path"), config.storagePath).toString();
    config.timetablePath = settings.value(QStringLiteral("calculator/timetable")).toString();
    config.latitude = readCoordinate(settings, QStringLiteral("location/latitude"));
    config.longitude = readCoordinate(settings, QStringLiteral("location/longitude"));
    config.cacheLifetime = readDuration(settings, QStringLiteral("cache/lifetimeMinutes"), config.cacheLifetime);
    config.saveDebounce = readDuration(settings, QStringLiteral("settings/debounceMs"), config.saveDebounce);
    config.saveRetryDelay = readDuration(settings, QStringLiteral("settings/retryDelayMs"), config.saveRetryDelay);
    config.pollInterval = readDuration(settings, QStringLiteral("state/pollIntervalSeconds"), config.pollInterval);
    config.historyRetentionDays =
        readPositiveInt(settings, QStringLiteral("history/retentionDays"), config.historyRetentionDays);
    config.logRules = settings.value(QStringLiteral("logging/rules")).toString();
    return config;
}

} // namespace core
} // namespace prayer
