#include "TaplineLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "tapline.app")
Q_LOGGING_CATEGORY(logData, "tapline.data")
Q_LOGGING_CATEGORY(logStore, "tapline.store")
Q_LOGGING_CATEGORY(logDebug, "tapline.debug", QtWarningMsg)
