#include "logging.hpp"

Q_LOGGING_CATEGORY(lcPath, "kalkan.path", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSanitizer, "kalkan.sanitizer", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLimiter, "kalkan.limiter", QtInfoMsg)
Q_LOGGING_CATEGORY(lcParser, "kalkan.parser", QtInfoMsg)
Q_LOGGING_CATEGORY(lcContext, "kalkan.context", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScanner, "kalkan.scanner", QtInfoMsg)
