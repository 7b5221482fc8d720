#pragma once

#include <optional>

namespace prayer {
namespace data {

struct Coordinates
{
    double latitude = 0.0;
    double longitude = 0.0;
};

// Used whenever the device location cannot be obtained.
constexpr Coordinates kKaabaCoordinates{ 21.422487, 39.826206 };

class LocationSource
{
public:
    virtual ~LocationSource() = default;

    // Throws core::LocationServiceError when no position is available.
    virtual Coordinates coordinates() = 0;
};

class FixedLocationSource : public LocationSource
{
public:
    FixedLocationSource() = default;
    explicit FixedLocationSource(Coordinates coordinates);

    void setCoordinates(std::optional<Coordinates> coordinates);
    Coordinates coordinates() override;

private:
    std::optional<Coordinates> m_coordinates;
};

} // namespace data
} // namespace prayer
