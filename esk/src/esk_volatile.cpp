/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <esk_config.h>
#include "esk_volatile.h"
#include "esk_log.h"

namespace esk {

void SimulatedIrq::Fire()
{
    m_pending = false;

    if (m_isr == NULL)
    {
        ESK_LOG_WARNING("irq: spurious interrupt, no ISR attached");
        return;
    }

    ++m_fired;
    m_isr(m_user_data);
}

void SimulatedIrq::Enable(bool enable)
{
    m_enabled = enable;

    if (m_enabled && m_pending)
        Fire();
}

void SimulatedIrq::Tick()
{
    if (++m_counter < m_period)
        return;

    m_counter = 0;
    m_pending = true;

    if (m_enabled)
        Fire();
}

uint32_t VolatileDemo::RunMainLoop(SimulatedIrq &irq, uint32_t iterations, uint32_t poll_interval)
{
    ESK_ASSERT(poll_interval != 0);

    uint32_t serviced = 0;

    for (uint32_t i = 1; i <= iterations; ++i)
    {
        irq.Tick();

        if ((i % poll_interval) == 0)
        {
            if (Poll())
                ++serviced;
        }
    }

    ESK_LOG_DEBUG("volatile: %u ticks, %u events serviced, %u coalesced",
        (unsigned)iterations, (unsigned)serviced, (unsigned)GetCoalescedCount());

    return serviced;
}

} // namespace esk
