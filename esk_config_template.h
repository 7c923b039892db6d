/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_CONFIG_H_
#define ESK_CONFIG_H_

// note: Rename this file to esk_config.h and place it to the folder which is first on the include path of
//       your project (normally where main.cpp is), then point ESK_CONFIG_DIR of CMake to that folder.
// note: Every source file must include esk_config.h before any other ESK header.

// Log verbosity: ESK_LOG_LEVEL_DEBUG, ESK_LOG_LEVEL_INFO (default), ESK_LOG_LEVEL_WARNING,
// ESK_LOG_LEVEL_ERROR or ESK_LOG_LEVEL_NONE
//#define ESK_LOG_LEVEL ESK_LOG_LEVEL_DEBUG

// Number of elements allocated by esk::Stack on the first Push (doubles when full)
//#define ESK_STACK_CAPACITY_INITIAL 8

// Maximum number of stages esk::BootTrace can hold (one boot takes esk::BOOT_STAGE_COUNT)
//#define ESK_BOOT_TRACE_CAPACITY 16

#endif /* ESK_CONFIG_H_ */
