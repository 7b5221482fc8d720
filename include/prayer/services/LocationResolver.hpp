#pragma once

#include "prayer/data/Location.hpp"

namespace prayer {
namespace services {

// Coordinates of the source, or the Kaaba when the source cannot provide any.
data::Coordinates resolveLocation(data::LocationSource &source);

} // namespace services
} // namespace prayer
