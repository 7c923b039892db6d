/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_FAULT_H_
#define ESK_FAULT_H_

#include "esk_common.h"

/*! \file  esk_fault.h
    \brief Fault register capture and triage: FaultSnapshot, FaultRegisters.
*/

namespace esk {

/*! \class FaultSnapshot
    \brief Immutable record of PC, SP and status register taken when the CPU halted on a fault.
    \see   FaultRegisters::Capture
*/
class FaultSnapshot
{
public:
    explicit FaultSnapshot(uint32_t pc, uint32_t sp, uint32_t status) : m_pc(pc), m_sp(sp), m_status(status)
    {}

    uint32_t GetPC() const { return m_pc; }
    uint32_t GetSP() const { return m_sp; }
    uint32_t GetStatus() const { return m_status; }

private:
    uint32_t m_pc;     //!< Program Counter
    uint32_t m_sp;     //!< Stack Pointer
    uint32_t m_status; //!< status register (xPSR)
};

/*! \enum  EFaultFinding
    \brief Findings reported by FaultRegisters::Triage (bit set).
*/
enum EFaultFinding
{
    FAULT_FINDING_NONE          = 0,
    FAULT_FINDING_INVALID_STATE = (1 << 0), //!< Thumb bit of xPSR is clear (INVSTATE usage fault)
    FAULT_FINDING_PC_UNALIGNED  = (1 << 1), //!< PC is not halfword aligned
    FAULT_FINDING_SP_UNALIGNED  = (1 << 2), //!< SP is not 8-byte aligned (AAPCS)
    FAULT_FINDING_SP_OUT_OF_RAM = (1 << 3), //!< SP is outside RAM (stack overflow or corruption)
    FAULT_FINDING_IN_EXCEPTION  = (1 << 4)  //!< fault was taken while handling an exception (IPSR != 0)
};

/*! \class FaultRegisters
    \brief Capture, triage and diagnostic print of the fault registers.

    Triage follows the checklist of a Cortex-M HardFault investigation: the status register must have
    the Thumb bit set, PC must point to a halfword boundary, SP must be 8-byte aligned and stay
    inside RAM, and the exception number tells which handler was active.

    \code
    void HardFault_Handler_C(const esk::IRegisterFile &regs) {
        esk::FaultSnapshot snapshot = esk::FaultRegisters::Capture(regs);
        uint32_t findings = esk::FaultRegisters::Triage(snapshot, RAM_START, RAM_END);
        esk::FaultRegisters::Print(snapshot, findings);
    }
    \endcode
*/
class FaultRegisters
{
public:
    enum EConsts
    {
        XPSR_THUMB_BIT     = (1 << 24), //!< T bit of EPSR
        XPSR_EXCEPTION_MSK = 0x1FF      //!< IPSR exception number field
    };

    /*! \brief     Take snapshot of the halted CPU registers.
        \param[in] regs: Register file of the halted CPU.
    */
    static FaultSnapshot Capture(const IRegisterFile &regs)
    {
        return FaultSnapshot(regs.GetPC(), regs.GetSP(), regs.GetStatus());
    }

    /*! \brief     Get number of the active exception from the status register (0 if Thread mode).
    */
    static uint32_t GetExceptionNumber(const FaultSnapshot &snapshot)
    {
        return (snapshot.GetStatus() & XPSR_EXCEPTION_MSK);
    }

    /*! \brief     Analyze snapshot.
        \param[in] snapshot: Snapshot to analyze.
        \param[in] ram_begin: First address of RAM.
        \param[in] ram_end: Address past the last byte of RAM (initial SP of a full-descending stack
                   equals ram_end and is considered inside RAM).
        \return    Bit set of EFaultFinding, FAULT_FINDING_NONE if nothing suspicious is found.
    */
    static uint32_t Triage(const FaultSnapshot &snapshot, uint32_t ram_begin, uint32_t ram_end);

    /*! \brief     Print snapshot and findings through the log (ESK_LOG_ERROR).
        \param[in] snapshot: Snapshot to print.
        \param[in] findings: Result of Triage().
    */
    static void Print(const FaultSnapshot &snapshot, uint32_t findings);

    /*! \brief     Get printable description of the single finding bit.
    */
    static const char *GetFindingName(EFaultFinding finding);
};

} // namespace esk

#endif /* ESK_FAULT_H_ */
