#pragma once

#include <memory>

namespace prayer {
namespace core {
struct AppConfig;
}

namespace data {

class KeyValueStore;
class FileKeyValueStore;
class PrayerCalculator;
class LocationSource;

// Owns the concrete adapters behind the data interfaces.
class DataProvider
{
public:
    explicit DataProvider(const core::AppConfig &config);
    ~DataProvider();

    KeyValueStore &store();
    PrayerCalculator &calculator();
    LocationSource &locationSource();

private:
    std::unique_ptr<FileKeyValueStore> m_store;
    std::unique_ptr<PrayerCalculator> m_calculator;
    std::unique_ptr<LocationSource> m_locationSource;
};

} // namespace data
} // namespace prayer
