/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include "esktest.h"

#define _ESK_TEST_RAM_BEGIN 0x20000000u
#define _ESK_TEST_RAM_END   0x20010000u
#define _ESK_TEST_XPSR_OK   0x01000000u // Thumb bit, Thread mode

namespace esk {
namespace test {

TEST_GROUP(FaultSnapshot)
{
    void setup() {}
    void teardown() {}
};

TEST(FaultSnapshot, Accessors)
{
    FaultSnapshot snapshot(0x08000200u, 0x20000FF0u, 0x21000003u);

    CHECK_EQUAL(0x08000200u, snapshot.GetPC());
    CHECK_EQUAL(0x20000FF0u, snapshot.GetSP());
    CHECK_EQUAL(0x21000003u, snapshot.GetStatus());
}

TEST(FaultSnapshot, Capture)
{
    RegisterFileMock regs(0x08001234u, 0x20007F00u, 0x01000003u);

    FaultSnapshot snapshot = FaultRegisters::Capture(regs);

    CHECK_EQUAL(0x08001234u, snapshot.GetPC());
    CHECK_EQUAL(0x20007F00u, snapshot.GetSP());
    CHECK_EQUAL(0x01000003u, snapshot.GetStatus());
    CHECK_EQUAL(3U, regs.m_reads);
}

TEST(FaultSnapshot, NotLiveView)
{
    RegisterFileMock regs(0x08001234u, 0x20007F00u, 0x01000003u);

    FaultSnapshot snapshot = FaultRegisters::Capture(regs);

    // CPU state changes after capture (e.g. debugger resumed the core)
    regs.m_pc     = 0;
    regs.m_sp     = 0;
    regs.m_status = 0;

    CHECK_EQUAL(0x08001234u, snapshot.GetPC());
    CHECK_EQUAL(0x20007F00u, snapshot.GetSP());
    CHECK_EQUAL(0x01000003u, snapshot.GetStatus());
}

TEST_GROUP(FaultRegisters)
{
    void setup() {}
    void teardown() {}

    static uint32_t Triage(uint32_t pc, uint32_t sp, uint32_t status)
    {
        return FaultRegisters::Triage(FaultSnapshot(pc, sp, status), _ESK_TEST_RAM_BEGIN, _ESK_TEST_RAM_END);
    }
};

TEST(FaultRegisters, Consistent)
{
    CHECK_EQUAL((uint32_t)FAULT_FINDING_NONE, Triage(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, InvalidState)
{
    // BX to an even address clears the T bit
    CHECK_EQUAL((uint32_t)FAULT_FINDING_INVALID_STATE, Triage(0x08000100u, 0x20001000u, 0));
}

TEST(FaultRegisters, PcUnaligned)
{
    CHECK_EQUAL((uint32_t)FAULT_FINDING_PC_UNALIGNED, Triage(0x08000101u, 0x20001000u, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, SpUnaligned)
{
    CHECK_EQUAL((uint32_t)FAULT_FINDING_SP_UNALIGNED, Triage(0x08000100u, 0x20001004u, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, SpBelowRam)
{
    // stack overflow ran the descending stack below the start of RAM
    CHECK_EQUAL((uint32_t)FAULT_FINDING_SP_OUT_OF_RAM, Triage(0x08000100u, 0x1FFFFFF0u, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, SpAboveRam)
{
    CHECK_EQUAL((uint32_t)FAULT_FINDING_SP_OUT_OF_RAM, Triage(0x08000100u, 0x20010008u, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, SpAtRamBoundaries)
{
    CHECK_EQUAL((uint32_t)FAULT_FINDING_NONE, Triage(0x08000100u, _ESK_TEST_RAM_END, _ESK_TEST_XPSR_OK));
    CHECK_EQUAL((uint32_t)FAULT_FINDING_NONE, Triage(0x08000100u, _ESK_TEST_RAM_BEGIN, _ESK_TEST_XPSR_OK));
}

TEST(FaultRegisters, ExceptionNumber)
{
    FaultSnapshot thread_mode(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK);
    FaultSnapshot systick(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK | 15);
    FaultSnapshot irq_240(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK | (16 + 240));

    CHECK_EQUAL(0U, FaultRegisters::GetExceptionNumber(thread_mode));
    CHECK_EQUAL(15U, FaultRegisters::GetExceptionNumber(systick));
    CHECK_EQUAL(256U, FaultRegisters::GetExceptionNumber(irq_240));

    CHECK_EQUAL((uint32_t)FAULT_FINDING_IN_EXCEPTION, Triage(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK | 15));
}

TEST(FaultRegisters, MultipleFindings)
{
    uint32_t findings = Triage(0x08000103u, 0x1FFFFFFEu, 0x0000000Bu);

    CHECK_TRUE((findings & FAULT_FINDING_INVALID_STATE) != 0);
    CHECK_TRUE((findings & FAULT_FINDING_PC_UNALIGNED) != 0);
    CHECK_TRUE((findings & FAULT_FINDING_SP_UNALIGNED) != 0);
    CHECK_TRUE((findings & FAULT_FINDING_SP_OUT_OF_RAM) != 0);
    CHECK_TRUE((findings & FAULT_FINDING_IN_EXCEPTION) != 0);
}

TEST(FaultRegisters, InvalidRamRange)
{
    try
    {
        g_TestContext.ExpectAssert(true);
        FaultRegisters::Triage(FaultSnapshot(0, 0, 0), _ESK_TEST_RAM_END, _ESK_TEST_RAM_BEGIN);
        CHECK_TEXT(false, "expecting assertion - RAM range is inverted");
    }
    catch (TestAssertPassed &pass)
    {
        CHECK(true);
        g_TestContext.ExpectAssert(false);
    }
}

TEST(FaultRegisters, PrintFindings)
{
    LogSinkMock sink;

    FaultSnapshot snapshot(0x08000A3Cu, 0x1FFFFFE0u, _ESK_TEST_XPSR_OK | 15);
    FaultRegisters::Print(snapshot, FAULT_FINDING_SP_OUT_OF_RAM | FAULT_FINDING_IN_EXCEPTION);

    CHECK_EQUAL(3, sink.m_count);
    CHECK_EQUAL(ESK_LOG_LEVEL_ERROR, sink.m_last_level);
    STRCMP_EQUAL("fault: pc=0x08000a3c sp=0x1fffffe0 xpsr=0x0100000f exception=15", sink.m_lines[0]);
    CHECK_TRUE(sink.Contains("SP outside RAM"));
    CHECK_TRUE(sink.Contains("fault inside exception handler"));
}

TEST(FaultRegisters, PrintNoFindings)
{
    LogSinkMock sink;

    FaultRegisters::Print(FaultSnapshot(0x08000100u, 0x20001000u, _ESK_TEST_XPSR_OK), FAULT_FINDING_NONE);

    CHECK_EQUAL(2, sink.m_count);
    CHECK_TRUE(sink.Contains("registers look consistent"));
}

TEST(FaultRegisters, FindingNames)
{
    STRCMP_EQUAL("none", FaultRegisters::GetFindingName(FAULT_FINDING_NONE));
    STRCMP_EQUAL("PC unaligned", FaultRegisters::GetFindingName(FAULT_FINDING_PC_UNALIGNED));
    STRCMP_EQUAL("SP not 8-byte aligned", FaultRegisters::GetFindingName(FAULT_FINDING_SP_UNALIGNED));
}

} // namespace test
} // namespace esk
