#include "prayer/services/LocationResolver.hpp"

#include "prayer/core/Errors.hpp"
#include "prayer/core/Logging.hpp"

namespace prayer {
namespace services {

data::Coordinates resolveLocation(data::LocationSource &source)
{
    try {
        return source.coordinates();
    } catch (const core::LocationServiceError &error) {
        qCWarning(core::lcLocation) << "Location unavailable, falling back to the Kaaba:" << error.message()
                                    << "cause:" << error.cause();
        return data::kKaabaCoordinates;
    }
}

} // namespace services
} // namespace prayer
