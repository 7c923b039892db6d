/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <esk_config.h>
#include "esk.h"

namespace esk {

const char *GetResultName(EResult result)
{
    switch (result)
    {
    case RESULT_OK:            return "RESULT_OK";
    case RESULT_EMPTY_STACK:   return "RESULT_EMPTY_STACK";
    case RESULT_NO_MEMORY:     return "RESULT_NO_MEMORY";
    case RESULT_INVALID_IMAGE: return "RESULT_INVALID_IMAGE";
    case RESULT_TRACE_FULL:    return "RESULT_TRACE_FULL";
    default:                   return "RESULT_UNKNOWN";
    }
}

} // namespace esk
