#include "prayer/data/DataProvider.hpp"

#include "prayer/core/AppConfig.hpp"
#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/FileKeyValueStore.hpp"
#include "prayer/data/Location.hpp"
#include "prayer/data/TimetablePrayerCalculator.hpp"

namespace prayer {
namespace data {

DataProvider::DataProvider(const core::AppConfig &config)
    : m_store(std::make_unique<FileKeyValueStore>(config.storagePath))
    , m_calculator(std::make_unique<TimetablePrayerCalculator>(config.timetablePath))
{
    try {
        m_store->open();
    } catch (const core::PersistenceError &error) {
        qCCritical(core::lcStore) << "Store unavailable:" << error.message();
    }

    auto location = std::make_unique<FixedLocationSource>();
    if (config.latitude && config.longitude) {
        location->setCoordinates(Coordinates{ *config.latitude, *config.longitude });
    }
    m_locationSource = std::move(location);
}

DataProvider::~DataProvider() = default;

KeyValueStore &DataProvider::store()
{
    return *m_store;
}

PrayerCalculator &DataProvider::calculator()
{
    return *m_calculator;
}

LocationSource &DataProvider::locationSource()
{
    return *m_locationSource;
}

} // namespace data
} // namespace prayer
