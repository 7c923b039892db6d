/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <esk_config.h>
#include "esk_fault.h"
#include "esk_log.h"

namespace esk {

static const EFaultFinding g_AllFindings[] =
{
    FAULT_FINDING_INVALID_STATE,
    FAULT_FINDING_PC_UNALIGNED,
    FAULT_FINDING_SP_UNALIGNED,
    FAULT_FINDING_SP_OUT_OF_RAM,
    FAULT_FINDING_IN_EXCEPTION
};

const char *FaultRegisters::GetFindingName(EFaultFinding finding)
{
    switch (finding)
    {
    case FAULT_FINDING_NONE:          return "none";
    case FAULT_FINDING_INVALID_STATE: return "invalid state (Thumb bit clear)";
    case FAULT_FINDING_PC_UNALIGNED:  return "PC unaligned";
    case FAULT_FINDING_SP_UNALIGNED:  return "SP not 8-byte aligned";
    case FAULT_FINDING_SP_OUT_OF_RAM: return "SP outside RAM";
    case FAULT_FINDING_IN_EXCEPTION:  return "fault inside exception handler";
    default:                          return "unknown";
    }
}

uint32_t FaultRegisters::Triage(const FaultSnapshot &snapshot, uint32_t ram_begin, uint32_t ram_end)
{
    ESK_ASSERT(ram_begin < ram_end);

    uint32_t findings = FAULT_FINDING_NONE;

    if ((snapshot.GetStatus() & XPSR_THUMB_BIT) == 0)
        findings |= FAULT_FINDING_INVALID_STATE;

    if ((snapshot.GetPC() & 0x1) != 0)
        findings |= FAULT_FINDING_PC_UNALIGNED;

    if ((snapshot.GetSP() & 0x7) != 0)
        findings |= FAULT_FINDING_SP_UNALIGNED;

    // full-descending stack: SP == ram_end is an empty stack
    if ((snapshot.GetSP() < ram_begin) || (snapshot.GetSP() > ram_end))
        findings |= FAULT_FINDING_SP_OUT_OF_RAM;

    if (GetExceptionNumber(snapshot) != 0)
        findings |= FAULT_FINDING_IN_EXCEPTION;

    return findings;
}

void FaultRegisters::Print(const FaultSnapshot &snapshot, uint32_t findings)
{
    ESK_LOG_ERROR("fault: pc=0x%08x sp=0x%08x xpsr=0x%08x exception=%u",
        (unsigned)snapshot.GetPC(), (unsigned)snapshot.GetSP(), (unsigned)snapshot.GetStatus(),
        (unsigned)GetExceptionNumber(snapshot));

    if (findings == FAULT_FINDING_NONE)
    {
        ESK_LOG_ERROR("fault: registers look consistent, check fault status registers (CFSR/HFSR)");
        return;
    }

    for (size_t i = 0; i < sizeof(g_AllFindings) / sizeof(g_AllFindings[0]); ++i)
    {
        if ((findings & g_AllFindings[i]) != 0)
            ESK_LOG_ERROR("fault: - %s", GetFindingName(g_AllFindings[i]));
    }
}

} // namespace esk
