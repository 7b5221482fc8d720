#pragma once

#include <QString>
#include <chrono>
#include <optional>

namespace prayer {
namespace core {

struct AppConfig
{
    QString storagePath;
    QString timetablePath;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::chrono::minutes cacheLifetime{ 24 * 60 };
    std::chrono::milliseconds saveDebounce{ 200 };
    std::chrono::milliseconds saveRetryDelay{ 1000 };
    std::chrono::seconds pollInterval{ 60 };
    int historyRetentionDays = 365;
    QString logRules;
};

QString defaultStoragePath();

// Missing keys keep their defaults. An empty path yields the defaults.
AppConfig loadConfig(const QString &iniPath);

} // namespace core
} // namespace prayer
