/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_DEFS_H_
#define ESK_DEFS_H_

#include <stddef.h>
#include <stdint.h>

/*! \file  esk_defs.h
    \brief Contains compiler low-level definitions and configuration defaults.
*/

/*! \def   __esk_forceinline
    \brief Inline function (function prefix).
*/
#ifdef __GNUC__
    #define __esk_forceinline __attribute__((always_inline)) inline
#elif defined(__ICCARM__) || defined(_MSC_VER)
    #define __esk_forceinline __forceinline
#else
    #define __esk_forceinline
#endif

/*! \def   __esk_attr_unused
    \brief Instruct compiler that marked type or object may be unused.
*/
#ifdef __GNUC__
    #define __esk_attr_unused __attribute__((unused))
#elif defined(__ICCARM__)
    #define __esk_attr_unused __attribute__((unused))
#else
    #define __esk_attr_unused
#endif

/*! \def   __esk_attr_format
    \brief Instruct compiler to check printf-style arguments (function suffix).
*/
#ifdef __GNUC__
    #define __esk_attr_format(FMT, ARGS) __attribute__((format(printf, FMT, ARGS)))
#else
    #define __esk_attr_format(FMT, ARGS)
#endif

/*! \def   __esk_full_memfence
    \brief Full memory barrier (compiler and CPU).
    \note  Orders the payload store against the ready-flag store (and the flag load against the
           payload load) in the ISR handoff primitives, see Mailbox.
*/
#ifdef __GNUC__
    #define __esk_full_memfence() __sync_synchronize()
#else
    #define __esk_full_memfence()
#endif

/*! \def   __esk_relax_cpu
    \brief Emits CPU relaxing instruction for usage inside a hot-spinning loop.
*/
#ifndef __esk_relax_cpu
#ifdef __GNUC__
    #if defined(__i386__) || defined(__x86_64__)
        #define __esk_relax_cpu() __builtin_ia32_pause()
    #else
        #define __esk_relax_cpu() __esk_full_memfence()
    #endif
#else
    #define __esk_relax_cpu()
#endif
#endif

/*! \def   ESK_ASSERT
    \brief A shortcut to the assert() function. Can be overridden by the alternative _ESK_ASSERT_IMPL
           if _ESK_ASSERT_REDIRECT is defined.
*/
#ifdef _ESK_ASSERT_REDIRECT
    extern void _ESK_ASSERT_IMPL(const char *, const char *, int32_t);
    #define ESK_ASSERT(e) ((e) ? (void)0 : _ESK_ASSERT_IMPL(#e, __FILE__, __LINE__))
#else
    #include <assert.h>
    #define ESK_ASSERT(e) assert(e)
#endif

/*! \def   ESK_STATIC_ASSERT_N
    \brief Complie-time assert with user-defined name.
*/
#define ESK_STATIC_ASSERT_N(NAME, X) typedef char __esk_static_assert_##NAME[(X) ? 1 : -1] __esk_attr_unused

/*! \def   ESK_STATIC_ASSERT
    \brief Complie-time assert.
*/
#define ESK_STATIC_ASSERT(X) ESK_STATIC_ASSERT_N(_, X)

/*! \def   ESK_LOG_LEVEL
    \brief Compile-time verbosity of the logging macros (see esk_log.h).
*/
#define ESK_LOG_LEVEL_DEBUG   0
#define ESK_LOG_LEVEL_INFO    1
#define ESK_LOG_LEVEL_WARNING 2
#define ESK_LOG_LEVEL_ERROR   3
#define ESK_LOG_LEVEL_NONE    4

#ifndef ESK_LOG_LEVEL
    #define ESK_LOG_LEVEL ESK_LOG_LEVEL_INFO
#endif

/*! \def   ESK_STACK_CAPACITY_INITIAL
    \brief Number of elements allocated by Stack on the first Push.
    \note  Capacity doubles every time the stack is full, can be redefined in esk_config.h.
*/
#ifndef ESK_STACK_CAPACITY_INITIAL
    #define ESK_STACK_CAPACITY_INITIAL 8
#endif

/*! \def   ESK_BOOT_TRACE_CAPACITY
    \brief Default maximum number of stages recorded by BootTrace.
*/
#ifndef ESK_BOOT_TRACE_CAPACITY
    #define ESK_BOOT_TRACE_CAPACITY 16
#endif

/*! \namespace esk
    \brief     Namespace of ESK package.
 */
namespace esk {
} // namespace esk

#endif /* ESK_DEFS_H_ */
