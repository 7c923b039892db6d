/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <string.h>

#include <esk_config.h>
#include <esk.h>
#include "example.h"

using namespace esk;

// Simulated memory map of a small Cortex-M part
#define DEMO_RAM_BEGIN 0x20000000u
#define DEMO_RAM_END   0x20008000u
#define DEMO_UART_PERIOD 3
#define DEMO_UART_BYTES  5

static bool DemoVolatile()
{
    SimulatedIrq timer(10);
    VolatileDemo demo;

    demo.Attach(timer);

    // main loop polls every tick: every interrupt is serviced
    uint32_t serviced = demo.RunMainLoop(timer, 100);
    ESK_LOG_INFO("volatile: polled every tick, %u of %u interrupts serviced",
        (unsigned)serviced, (unsigned)demo.GetInterruptCount());

    // busy main loop polls every 25 ticks: interrupts are coalesced
    uint32_t slow = demo.RunMainLoop(timer, 100, 25);
    ESK_LOG_INFO("volatile: polled every 25 ticks, %u events serviced, %u interrupts coalesced",
        (unsigned)slow, (unsigned)demo.GetCoalescedCount());

    return (serviced == 10) && (slow == 4);
}

/*! \class UartRxSimulator
    \brief Emulates UART receive interrupt which hands received bytes to the main loop.
*/
class UartRxSimulator
{
public:
    explicit UartRxSimulator(IsrMailbox &mailbox) : m_mailbox(mailbox), m_next('A')
    {}

    static void Isr(void *user_data)
    {
        UartRxSimulator *uart = static_cast<UartRxSimulator *>(user_data);

        // a byte is lost if the main loop did not consume the previous one (counted by the mailbox)
        if (uart->m_mailbox.Write(uart->m_next))
            ++uart->m_next;
    }

private:
    IsrMailbox &m_mailbox;
    uint8_t     m_next;
};

static bool DemoMailbox()
{
    IsrMailbox mailbox;
    UartRxSimulator uart(mailbox);
    SimulatedIrq rx_irq(DEMO_UART_PERIOD);

    rx_irq.Attach(&UartRxSimulator::Isr, &uart);

    uint8_t value = 0;
    bool ok = !mailbox.TryRead(value);

    char received[DEMO_UART_BYTES + 1] = {};
    uint32_t count = 0;

    while (count < DEMO_UART_BYTES)
    {
        rx_irq.Tick();

        if (mailbox.TryRead(value))
            received[count++] = (char)value;
    }

    ok = ok && (strcmp(received, "ABCDE") == 0) && (mailbox.GetOverrunCount() == 0);

    ESK_LOG_INFO("mailbox: received \"%s\", overruns %u", received, (unsigned)mailbox.GetOverrunCount());
    return ok;
}

/*! \class DemoFirmware
    \brief Memory of the simulated firmware image booted by DemoBoot.
*/
struct DemoFirmware
{
    uint8_t  flash_data[4]; //!< .data load image
    uint8_t  ram_data[4];   //!< .data in RAM
    uint8_t  ram_bss[8];    //!< .bss in RAM
    uint32_t constructed;   //!< number of executed static constructors
    bool     main_called;   //!< main was reached

    static void Constructor(void *user_data)
    {
        ++static_cast<DemoFirmware *>(user_data)->constructed;
    }

    static void Main(void *user_data)
    {
        static_cast<DemoFirmware *>(user_data)->main_called = true;
    }
};

static bool DemoBoot()
{
    DemoFirmware fw;
    memset(&fw, 0xA5, sizeof(fw)); // RAM content is undefined after power-up
    fw.constructed = 0;
    fw.main_called = false;

    static const uint8_t load_image[4] = { 0xDE, 0xAD, 0xBE, 0xEF };
    memcpy(fw.flash_data, load_image, sizeof(load_image));

    const EntryFuncType ctors[] = { &DemoFirmware::Constructor, &DemoFirmware::Constructor };

    BootImage image;
    memset(&image, 0, sizeof(image));
    image.initial_sp   = DEMO_RAM_END;
    image.reset_vector = 0x08000131; // Thumb bit set
    image.data_load    = fw.flash_data;
    image.data_ram     = fw.ram_data;
    image.data_size    = sizeof(fw.ram_data);
    image.bss          = fw.ram_bss;
    image.bss_size     = sizeof(fw.ram_bss);
    image.init_array   = ctors;
    image.init_count   = sizeof(ctors) / sizeof(ctors[0]);
    image.main_func    = &DemoFirmware::Main;
    image.user_data    = &fw;

    BootTrace trace;
    BootSequence boot(trace);

    EResult result = boot.Run(image);
    if (result != RESULT_OK)
    {
        ESK_LOG_ERROR("boot: failed with %s", GetResultName(result));
        return false;
    }

    for (size_t i = 0; i < trace.GetSize(); ++i)
    {
        const BootTraceEntry &entry = trace.GetEntry(i);
        ESK_LOG_INFO("boot: %u. %s (0x%x)", (unsigned)(i + 1), GetBootStageName(entry.stage), (unsigned)entry.detail);
    }

    bool bss_zeroed = true;
    for (size_t i = 0; i < sizeof(fw.ram_bss); ++i)
        bss_zeroed = bss_zeroed && (fw.ram_bss[i] == 0);

    return fw.main_called && bss_zeroed && (fw.constructed == 2) &&
        (memcmp(fw.ram_data, load_image, sizeof(load_image)) == 0);
}

static bool DemoStack()
{
    Stack<int32_t> stack;

    for (int32_t i = 1; i <= 3; ++i)
    {
        if (stack.Push(i) != RESULT_OK)
            return false;
    }

    bool ok = true;
    for (int32_t expected = 3; expected >= 1; --expected)
    {
        int32_t value = 0;
        EResult result = stack.Pop(value);

        ESK_LOG_INFO("stack: pop -> %d (%s)", (int)value, GetResultName(result));
        ok = ok && (result == RESULT_OK) && (value == expected);
    }

    int32_t value = 0;
    EResult result = stack.Pop(value);
    ESK_LOG_INFO("stack: pop on empty stack -> %s", GetResultName(result));

    return ok && (result == RESULT_EMPTY_STACK);
}

/*! \class HaltedCore
    \brief Register file of the simulated core halted by a stack overflow inside SysTick handler.
*/
class HaltedCore : public IRegisterFile
{
public:
    uint32_t GetPC() const { return 0x08000A3Cu; }
    uint32_t GetSP() const { return DEMO_RAM_BEGIN - 0x20u; }  // ran below RAM start
    uint32_t GetStatus() const { return 0x0100000Fu; }         // Thumb bit, exception 15 (SysTick)
};

static bool DemoFault()
{
    HaltedCore core;

    FaultSnapshot snapshot = FaultRegisters::Capture(core);
    uint32_t findings = FaultRegisters::Triage(snapshot, DEMO_RAM_BEGIN, DEMO_RAM_END);

    FaultRegisters::Print(snapshot, findings);

    return (findings == (FAULT_FINDING_SP_OUT_OF_RAM | FAULT_FINDING_IN_EXCEPTION));
}

int RunExample()
{
    struct Demo
    {
        const char *name;
        bool (*run)();
    };

    static const Demo demos[] =
    {
        { "volatile", &DemoVolatile },
        { "mailbox",  &DemoMailbox },
        { "boot",     &DemoBoot },
        { "stack",    &DemoStack },
        { "fault",    &DemoFault }
    };

    int failed = 0;

    for (size_t i = 0; i < sizeof(demos) / sizeof(demos[0]); ++i)
    {
        ESK_LOG_INFO("=== %s ===", demos[i].name);

        if (!demos[i].run())
        {
            ESK_LOG_ERROR("%s: unexpected result", demos[i].name);
            ++failed;
        }
    }

    return (failed == 0 ? 0 : 1);
}
