#ifndef KALKAN_LOGGING_HPP
#define KALKAN_LOGGING_HPP

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPath)
Q_DECLARE_LOGGING_CATEGORY(lcSanitizer)
Q_DECLARE_LOGGING_CATEGORY(lcLimiter)
Q_DECLARE_LOGGING_CATEGORY(lcParser)
Q_DECLARE_LOGGING_CATEGORY(lcContext)
Q_DECLARE_LOGGING_CATEGORY(lcScanner)

#endif // KALKAN_LOGGING_HPP
