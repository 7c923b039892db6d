/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_LOG_H_
#define ESK_LOG_H_

#include "esk_common.h"

/*! \file  esk_log.h
    \brief Logging macros.

    Verbosity is selected at compile time with ESK_LOG_LEVEL in esk_config.h:
     - ESK_LOG_LEVEL_DEBUG:   debug, info, warning and error lines
     - ESK_LOG_LEVEL_INFO:    info, warning and error lines (default)
     - ESK_LOG_LEVEL_WARNING: warning and error lines
     - ESK_LOG_LEVEL_ERROR:   error lines only
     - ESK_LOG_LEVEL_NONE:    logging is compiled out

    \code
    ESK_LOG_INFO("boot: %u stages", (unsigned)trace.GetSize());
    \endcode
*/

namespace esk {

/*! \namespace esk::log
    \brief     Namespace of the logging back-end.
 */
namespace log {

/*! \brief     Format and emit one log line.
    \note      Prefer ESK_LOG_* macros which are filtered by ESK_LOG_LEVEL.
    \param[in] level: Log level of the line.
    \param[in] fmt: printf-style format string.
*/
void Write(int32_t level, const char *fmt, ...) __esk_attr_format(2, 3);

/*! \brief     Install log sink.
    \param[in] sink: Sink which receives formatted lines, NULL to restore output to stdout.
    \return    Previously installed sink (NULL if none).
*/
ILogSink *SetSink(ILogSink *sink);

/*! \brief     Get printable tag of the log level ("DEBUG", "INFO", "WARNING", "ERROR").
*/
const char *GetLevelTag(int32_t level);

} // namespace log
} // namespace esk

#if ESK_LOG_LEVEL <= ESK_LOG_LEVEL_DEBUG
    #define ESK_LOG_DEBUG(fmt, ...) ::esk::log::Write(ESK_LOG_LEVEL_DEBUG, fmt, ##__VA_ARGS__)
#else
    #define ESK_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#if ESK_LOG_LEVEL <= ESK_LOG_LEVEL_INFO
    #define ESK_LOG_INFO(fmt, ...) ::esk::log::Write(ESK_LOG_LEVEL_INFO, fmt, ##__VA_ARGS__)
#else
    #define ESK_LOG_INFO(fmt, ...) ((void)0)
#endif

#if ESK_LOG_LEVEL <= ESK_LOG_LEVEL_WARNING
    #define ESK_LOG_WARNING(fmt, ...) ::esk::log::Write(ESK_LOG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#else
    #define ESK_LOG_WARNING(fmt, ...) ((void)0)
#endif

#if ESK_LOG_LEVEL <= ESK_LOG_LEVEL_ERROR
    #define ESK_LOG_ERROR(fmt, ...) ::esk::log::Write(ESK_LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#else
    #define ESK_LOG_ERROR(fmt, ...) ((void)0)
#endif

#endif /* ESK_LOG_H_ */
