/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_MAILBOX_H_
#define ESK_MAILBOX_H_

#include <type_traits>

#include "esk_common.h"

/*! \file  esk_mailbox.h
    \brief Implementation of ISR-to-main handoff primitive: Mailbox.
*/

namespace esk {

/*! \class  Mailbox
    \brief  Lock-free single-slot handoff cell between an ISR (producer) and the main loop (consumer).
    \tparam T Data type of the payload (scalar).

    The cell consists of the payload and the ready flag. Correctness relies on the ordering only:
     - \c Write() stores the payload, issues a full memory fence, then sets the ready flag;
     - \c TryRead() loads the ready flag, issues a full memory fence, then loads the payload and
       finally clears the flag.

    A consumer can therefore never observe the flag set before the payload is complete. A \c Write()
    issued while the previous payload is still unconsumed is rejected and counted as an overrun, so the
    payload never changes under a consumer which already observed the flag.

    \code
    // Example: UART receive interrupt hands received byte to the main loop
    static esk::IsrMailbox g_RxMailbox;

    void UART_RX_IRQHandler() {
        g_RxMailbox.Write(UART->DR);
    }

    int main() {
        while (true) {
            uint8_t byte;
            if (g_RxMailbox.TryRead(byte)) {
                // ... process byte ...
            }
        }
    }
    \endcode

    \note  Single producer and single consumer only. No locks are taken, both methods are ISR-safe.
*/
template <typename T>
class Mailbox
{
public:
    /*! \brief     Constructor.
    */
    explicit Mailbox() : m_value(), m_ready(false), m_overruns(0)
    {
        // note: payload is accessed through volatile, only scalar types can be copied that way
        ESK_STATIC_ASSERT(std::is_scalar<T>::value);
    }

    /*! \brief     Publish value to the consumer (producer side, normally an ISR).
        \param[in] value: Value to store.
        \return    \c true if value was published, \c false if the previous value is not consumed yet
                   (overrun, value is dropped).
    */
    bool Write(const T &value)
    {
        if (m_ready)
        {
            ++m_overruns;
            return false;
        }

        m_value = value;

        // payload must be complete before flag becomes visible
        __esk_full_memfence();

        m_ready = true;
        return true;
    }

    /*! \brief      Consume value if one was published (consumer side, normally the main loop).
        \param[out] value: Variable where consumed value is stored, left untouched if there is no data.
        \return     \c true if value was consumed, \c false if there is no data (not an error).
    */
    bool TryRead(T &value)
    {
        if (!m_ready)
            return false;

        // flag must be observed before payload is loaded
        __esk_full_memfence();

        value = m_value;

        // payload must be loaded before slot is released to the producer
        __esk_full_memfence();

        m_ready = false;
        return true;
    }

    /*! \brief     Check if a published value is waiting to be consumed.
        \note      The returned value is a point-in-time snapshot.
    */
    bool IsReady() const { return m_ready; }

    /*! \brief     Get number of values dropped by \c Write() because the slot was occupied.
    */
    uint32_t GetOverrunCount() const { return m_overruns; }

private:
    volatile T        m_value;    //!< payload
    volatile bool     m_ready;    //!< true if payload is published and not consumed yet
    volatile uint32_t m_overruns; //!< number of rejected writes (producer side only)
};

/*! \typedef IsrMailbox
    \brief   Single-byte mailbox.
*/
typedef Mailbox<uint8_t> IsrMailbox;

} // namespace esk

#endif /* ESK_MAILBOX_H_ */
