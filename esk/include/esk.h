/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_H_
#define ESK_H_

/*! \file  esk.h
    \brief Includes the whole ESK inventory.
*/

#include "esk_common.h"
#include "esk_log.h"
#include "esk_volatile.h"
#include "esk_mailbox.h"
#include "esk_boot.h"
#include "esk_stack.h"
#include "esk_fault.h"

#endif /* ESK_H_ */
