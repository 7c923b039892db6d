/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_CONFIG_H_
#define ESK_CONFIG_H_

// note: Default host configuration, see esk_config_template.h for the description of the options.

#define ESK_LOG_LEVEL ESK_LOG_LEVEL_INFO

#endif /* ESK_CONFIG_H_ */
