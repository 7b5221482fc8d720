#include "prayer/services/SettingsStore.hpp"

#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/JsonCodec.hpp"
#include "prayer/data/KeyValueStore.hpp"

namespace prayer {
namespace services {

const char *const SettingsStore::kStorageKey = "app_settings";

SettingsStore::SettingsStore(data::KeyValueStore &store,
                             std::chrono::milliseconds debounce,
                             std::chrono::milliseconds retryDelay,
                             QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(debounce);
    connect(&m_debounceTimer, &QTimer::timeout, this, &SettingsStore::flushDebounced);

    m_retryTimer.setSingleShot(true);
    m_retryTimer.setInterval(retryDelay);
    connect(&m_retryTimer, &QTimer::timeout, this, &SettingsStore::retryWrite);
}

SettingsStore::~SettingsStore()
{
    m_debounceTimer.stop();
    m_retryTimer.stop();
}

const data::Settings &SettingsStore::settings() const
{
    return m_settings;
}

bool SettingsStore::isLoaded() const
{
    return m_loaded;
}

const data::Settings &SettingsStore::load()
{
    const QString key = QString::fromLatin1(kStorageKey);

    std::optional<QByteArray> blob;
    try {
        blob = m_store.get(key);
    } catch (const core::PersistenceError &error) {
        qCCritical(core::lcSettings) << "Cannot read settings, keeping current values:" << error.message();
        m_loaded = true;
        emit loaded();
        return m_settings;
    }

    if (!blob || blob->isEmpty()) {
        qCInfo(core::lcSettings) << "No stored settings, persisting defaults";
        publish(data::Settings{});
        writeNow();
    } else if (const auto decoded = data::decodeSettings(*blob)) {
        publish(*decoded);
        qCInfo(core::lcSettings) << "Settings loaded: method" << m_settings.calculationMethod << "school"
                                 << m_settings.legalSchool << "language" << m_settings.language;
    } else {
        qCCritical(core::lcSettings) << "Stored settings are malformed, resetting to defaults. Preview:"
                                     << blob->left(100);
        publish(data::Settings{});
        writeNow();
    }

    m_loaded = true;
    emit loaded();
    return m_settings;
}

void SettingsStore::initialize()
{
    if (m_store.isReady()) {
        load();
        return;
    }
    qCWarning(core::lcSettings) << "Store not ready, publishing defaults until settings load";
    emit settingsChanged(m_settings);
    QTimer::singleShot(0, this, [this]() { load(); });
}

bool SettingsStore::save(const data::Settings &settings)
{
    m_debounceTimer.stop();
    publish(settings);
    return writeNow();
}

SettingsStore::UpdateOutcome SettingsStore::updateField(const Setter &setter, Persistence mode)
{
    data::Settings next = m_settings;
    setter(next);
    if (next == m_settings) {
        return UpdateOutcome::Unchanged;
    }
    publish(next);

    if (mode == Persistence::Debounced) {
        m_debounceTimer.start();
        return UpdateOutcome::Deferred;
    }
    m_debounceTimer.stop();
    return writeNow() ? UpdateOutcome::Persisted : UpdateOutcome::WriteFailed;
}

bool SettingsStore::hasPendingSave() const
{
    return m_debounceTimer.isActive();
}

bool SettingsStore::isRetryPending() const
{
    return m_retryTimer.isActive();
}

void SettingsStore::shutdown()
{
    if (m_debounceTimer.isActive()) {
        m_debounceTimer.stop();
        writeNow();
    }
    m_retryTimer.stop();
}

void SettingsStore::publish(const data::Settings &settings)
{
    if (settings == m_settings) {
        return;
    }
    m_settings = settings;
    emit settingsChanged(m_settings);
}

bool SettingsStore::writeNow()
{
    try {
        m_store.set(QString::fromLatin1(kStorageKey), data::encodeSettings(m_settings));
        m_retryTimer.stop();
        qCDebug(core::lcSettings) << "Settings saved";
        return true;
    } catch (const core::PersistenceError &error) {
        qCWarning(core::lcSettings) << "Saving settings failed, retrying once:" << error.message();
        if (!m_retryTimer.isActive()) {
            m_retryTimer.start();
        }
        return false;
    }
}

void SettingsStore::flushDebounced()
{
    writeNow();
}

void SettingsStore::retryWrite()
{
    try {
        m_store.set(QString::fromLatin1(kStorageKey), data::encodeSettings(m_settings));
        qCInfo(core::lcSettings) << "Settings saved on retry";
    } catch (const core::PersistenceError &error) {
        qCCritical(core::lcSettings) << "Saving settings failed again, keeping them in memory:" << error.message();
        emit persistenceFailed(error.message());
    }
}

} // namespace services
} // namespace prayer
