#pragma once

#include <QObject>
#include <QTimer>
#include <chrono>
#include <functional>

#include "prayer/data/Settings.hpp"

namespace prayer {
namespace data {
class KeyValueStore;
}

namespace services {

// Holds the current settings and persists them as one JSON blob.
//
// Debounced updates coalesce into a single write after a quiet period;
// immediate updates cancel a pending debounce and write right away. A failed
// write is retried once after a fixed delay. The in-memory settings stay
// authoritative whatever the store does.
class SettingsStore : public QObject
{
    Q_OBJECT

public:
    enum class Persistence
    {
        Debounced,
        Immediate,
    };

    enum class UpdateOutcome
    {
        Unchanged,
        Persisted,
        Deferred,
        WriteFailed,
    };

    using Setter = std::function<void(data::Settings &)>;

    static const char *const kStorageKey;

    explicit SettingsStore(data::KeyValueStore &store,
                           std::chrono::milliseconds debounce = std::chrono::milliseconds(200),
                           std::chrono::milliseconds retryDelay = std::chrono::milliseconds(1000),
                           QObject *parent = nullptr);
    ~SettingsStore() override;

    const data::Settings &settings() const;
    bool isLoaded() const;

    // Reads the stored blob. Missing or unreadable data is replaced by the
    // defaults, which are written back immediately.
    const data::Settings &load();

    // Loads right away when the store is ready, otherwise publishes the
    // defaults and loads on the next event-loop turn.
    void initialize();

    bool save(const data::Settings &settings);
    UpdateOutcome updateField(const Setter &setter, Persistence mode);

    bool hasPendingSave() const;
    bool isRetryPending() const;

    // Flushes a pending debounced write and stops every timer.
    void shutdown();

signals:
    void settingsChanged(const prayer::data::Settings &settings);
    void persistenceFailed(const QString &message);
    void loaded();

private:
    void publish(const data::Settings &settings);
    bool writeNow();
    void flushDebounced();
    void retryWrite();

    data::KeyValueStore &m_store;
    data::Settings m_settings;
    QTimer m_debounceTimer;
    QTimer m_retryTimer;
    bool m_loaded = false;
};

} // namespace services
} // namespace prayer
