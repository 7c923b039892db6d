/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef EXAMPLE_H_
#define EXAMPLE_H_

/*! \brief     Run all demonstrations.
    \return    0 on success, 1 if any demonstration produced unexpected result.
*/
extern int RunExample();

#endif /* EXAMPLE_H_ */
