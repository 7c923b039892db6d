/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_VOLATILE_H_
#define ESK_VOLATILE_H_

#include "esk_common.h"

/*! \file  esk_volatile.h
    \brief Volatile flag handoff between interrupt and main loop: SimulatedIrq, VolatileDemo.
*/

namespace esk {

/*! \class SimulatedIrq
    \brief Periodic interrupt line driven by Tick() calls (host replacement of a timer peripheral).

    The line becomes pending every \a period ticks. A pending line fires its ISR immediately when
    enabled, otherwise it stays pending until Enable(true) is called, as with NVIC pending bits.
    Several periods elapsing while masked still result in a single ISR invocation.
*/
class SimulatedIrq
{
public:
    /*! \brief     Constructor.
        \param[in] period: Number of ticks between interrupts (must be non-zero).
    */
    explicit SimulatedIrq(uint32_t period) : m_isr(NULL), m_user_data(NULL), m_period(period),
        m_counter(0), m_fired(0), m_enabled(true), m_pending(false)
    {
        ESK_ASSERT(period != 0);
    }

    /*! \brief     Attach interrupt service routine.
        \param[in] isr: ISR function (must not be NULL).
        \param[in] user_data: User data supplied to ISR.
    */
    void Attach(IsrFuncType isr, void *user_data)
    {
        ESK_ASSERT(isr != NULL);

        m_isr       = isr;
        m_user_data = user_data;
    }

    /*! \brief     Enable (unmask) or disable (mask) the line.
        \note      Enabling the line with pending interrupt fires ISR before returning.
    */
    void Enable(bool enable);

    /*! \brief     Advance time by one tick.
    */
    void Tick();

    bool IsEnabled() const { return m_enabled; }
    bool IsPending() const { return m_pending; }

    /*! \brief     Get number of ISR invocations.
    */
    uint32_t GetFiredCount() const { return m_fired; }

private:
    void Fire();

    IsrFuncType m_isr;       //!< interrupt service routine
    void       *m_user_data; //!< user data of ISR
    uint32_t    m_period;    //!< ticks between interrupts
    uint32_t    m_counter;   //!< ticks since last period
    uint32_t    m_fired;     //!< number of ISR invocations
    bool        m_enabled;   //!< false if masked
    bool        m_pending;   //!< interrupt is pending while masked
};

/*! \class VolatileDemo
    \brief Event flag set by ISR and polled by the main loop.

    The flag is \c volatile: the compiler must reload it from memory on every Poll(), otherwise
    a loop like \c while(!m_event) may be optimized into an infinite loop because nothing in the
    loop body writes the flag. Volatile does not make read-modify-write atomic, therefore only the
    ISR sets the flag and only the main loop clears it.

    Interrupts arriving while the flag is still set are coalesced: the main loop services one event
    for all of them (see GetCoalescedCount()).

    \code
    esk::SimulatedIrq timer(10);
    esk::VolatileDemo demo;

    demo.Attach(timer);
    uint32_t serviced = demo.RunMainLoop(timer, 100); // 10
    \endcode
*/
class VolatileDemo
{
public:
    explicit VolatileDemo() : m_event(false), m_isr_count(0), m_serviced(0)
    {}

    /*! \brief     Connect OnInterrupt() to the interrupt line.
    */
    void Attach(SimulatedIrq &irq) { irq.Attach(&Isr, this); }

    /*! \brief     Interrupt side: raise event flag.
    */
    void OnInterrupt()
    {
        m_isr_count = m_isr_count + 1;
        m_event = true;
    }

    /*! \brief     Main loop side: check and clear event flag.
        \return    \c true if event was pending and is now serviced.
    */
    bool Poll()
    {
        if (!m_event)
            return false;

        m_event = false;
        ++m_serviced;
        return true;
    }

    /*! \brief     Run main loop.
        \param[in] irq: Interrupt line advanced by one tick per iteration.
        \param[in] iterations: Number of ticks to run.
        \param[in] poll_interval: Main loop polls the flag once every \a poll_interval ticks
                   (1 - every tick, larger values emulate a busy main loop).
        \return    Number of events serviced during this run.
    */
    uint32_t RunMainLoop(SimulatedIrq &irq, uint32_t iterations, uint32_t poll_interval = 1);

    bool IsEventPending() const { return m_event; }
    uint32_t GetInterruptCount() const { return m_isr_count; }
    uint32_t GetServicedCount() const { return m_serviced; }

    /*! \brief     Get number of interrupts which were merged into an already pending event.
    */
    uint32_t GetCoalescedCount() const
    {
        return m_isr_count - m_serviced - (m_event ? 1 : 0);
    }

private:
    static void Isr(void *user_data)
    {
        static_cast<VolatileDemo *>(user_data)->OnInterrupt();
    }

    volatile bool     m_event;     //!< event flag shared with ISR
    volatile uint32_t m_isr_count; //!< number of ISR invocations (written by ISR only)
    uint32_t          m_serviced;  //!< number of serviced events (main loop only)
};

} // namespace esk

#endif /* ESK_VOLATILE_H_ */
