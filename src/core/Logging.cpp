#include "prayer/core/Logging.hpp"

namespace prayer {
namespace core {

Q_LOGGING_CATEGORY(lcCache, "prayer.cache")
Q_LOGGING_CATEGORY(lcSettings, "prayer.settings")
Q_LOGGING_CATEGORY(lcNotify, "prayer.notify")
Q_LOGGING_CATEGORY(lcCompletion, "prayer.completion")
Q_LOGGING_CATEGORY(lcState, "prayer.state")
Q_LOGGING_CATEGORY(lcStore, "prayer.store")
Q_LOGGING_CATEGORY(lcLocation, "prayer.location")
Q_LOGGING_CATEGORY(lcApp, "prayer.app")

} // namespace core
} // namespace prayer
