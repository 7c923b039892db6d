/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <stdio.h>
#include <stdarg.h>

#include <esk_config.h>
#include "esk_log.h"

namespace esk {
namespace log {

enum EConsts
{
    LINE_SIZE_MAX = 256 //!< longer lines are truncated
};

static ILogSink *g_Sink = NULL;

const char *GetLevelTag(int32_t level)
{
    switch (level)
    {
    case ESK_LOG_LEVEL_DEBUG:   return "DEBUG";
    case ESK_LOG_LEVEL_INFO:    return "INFO";
    case ESK_LOG_LEVEL_WARNING: return "WARNING";
    case ESK_LOG_LEVEL_ERROR:   return "ERROR";
    default:                    return "?";
    }
}

ILogSink *SetSink(ILogSink *sink)
{
    ILogSink *prev = g_Sink;
    g_Sink = sink;
    return prev;
}

void Write(int32_t level, const char *fmt, ...)
{
    char line[LINE_SIZE_MAX];

    va_list args;
    va_start(args, fmt);
    int32_t len = vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    if (len < 0)
        return;

    if (g_Sink != NULL)
    {
        g_Sink->OnLogLine(level, line);
        return;
    }

    printf("[%s] %s\n", GetLevelTag(level), line);
}

} // namespace log
} // namespace esk
