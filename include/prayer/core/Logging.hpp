#pragma once

#include <QLoggingCategory>

namespace prayer {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcCache)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcNotify)
Q_DECLARE_LOGGING_CATEGORY(lcCompletion)
Q_DECLARE_LOGGING_CATEGORY(lcState)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcLocation)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

} // namespace core
} // namespace prayer
