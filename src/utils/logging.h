/**
 * @file logging.h
 * @brief Runtime verbose flag for per-file tracing.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QLoggingCategory>

namespace twinfm {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

/**
 * @brief Switches verbose tracing on or off.
 *
 * Also lets debug messages through when the platform's logging rules
 * filter them by default.
 */
inline void setVerboseLogging(bool enabled)
{
    verboseLogging = enabled;
    if (enabled) {
        QLoggingCategory::setFilterRules(QStringLiteral("default.debug=true"));
    }
}

} // namespace twinfm

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (twinfm::verboseLogging) qDebug()

#endif // LOGGING_H
