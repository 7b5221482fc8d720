#include "prayer/data/Location.hpp"

#include "prayer/core/Errors.hpp"

namespace prayer {
namespace data {

FixedLocationSource::FixedLocationSource(Coordinates coordinates)
    : m_coordinates(coordinates)
{
}

void FixedLocationSource::setCoordinates(std::optional<Coordinates> coordinates)
{
    m_coordinates = coordinates;
}

Coordinates FixedLocationSource::coordinates()
{
    if (!m_coordinates) {
        throw core::LocationServiceError(QStringLiteral("No coordinates configured"),
                                         QStringLiteral("location/latitude and location/longitude are unset"));
    }
    return *m_coordinates;
}

} // namespace data
} // namespace prayer
