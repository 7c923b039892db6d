/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_COMMON_H_
#define ESK_COMMON_H_

#include "esk_defs.h"

/*! \file  esk_common.h
    \brief Contains interface definitions of the library.
*/

namespace esk {

/*! \enum  EResult
    \brief Result of the operation which can fail at run-time.
    \note  Programming errors are not reported by EResult, they trigger ESK_ASSERT instead.
*/
enum EResult : int32_t
{
    RESULT_OK = 0,        //!< operation completed
    RESULT_EMPTY_STACK,   //!< Pop or Peek was called on an empty Stack
    RESULT_NO_MEMORY,     //!< memory allocation failed
    RESULT_INVALID_IMAGE, //!< boot image is malformed and was rejected before the reset handler started
    RESULT_TRACE_FULL     //!< boot trace has no space left for a new stage
};

/*! \brief     Get printable name of the result code.
    \param[in] result: Result code.
    \return    Null-terminated constant string, "RESULT_UNKNOWN" for the value outside EResult.
*/
const char *GetResultName(EResult result);

/*! \typedef IsrFuncType
    \brief   Interrupt service routine prototype.
    \see     SimulatedIrq
*/
typedef void (*IsrFuncType) (void *user_data);

/*! \typedef EntryFuncType
    \brief   Entry point prototype (main, static constructor) invoked by the reset handler.
    \see     BootImage
*/
typedef void (*EntryFuncType) (void *user_data);

/*! \class IRegisterFile
    \brief Interface for the register file of a halted CPU.

    Concrete implementation reads the registers stacked by the fault handler (on a real target) or
    returns the state of a simulated core (on host).

    \see   FaultRegisters::Capture
*/
class IRegisterFile
{
public:
    /*! \brief     Get Program Counter (PC) at the moment of the fault.
    */
    virtual uint32_t GetPC() const = 0;

    /*! \brief     Get Stack Pointer (SP) at the moment of the fault.
    */
    virtual uint32_t GetSP() const = 0;

    /*! \brief     Get status register (xPSR on Cortex-M) at the moment of the fault.
    */
    virtual uint32_t GetStatus() const = 0;
};

/*! \class ILogSink
    \brief Interface for a log output overrider.
    \note  Optional. When installed with log::SetSink it receives every formatted line instead of stdout.
*/
class ILogSink
{
public:
    /*! \brief     Called for every formatted log line.
        \param[in] level: Log level (ESK_LOG_LEVEL_DEBUG .. ESK_LOG_LEVEL_ERROR).
        \param[in] line: Null-terminated formatted text (without trailing new line).
    */
    virtual void OnLogLine(int32_t level, const char *line) = 0;
};

} // namespace esk

#endif /* ESK_COMMON_H_ */
