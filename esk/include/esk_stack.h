/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_STACK_H_
#define ESK_STACK_H_

#include <new> // for std::nothrow

#include "esk_common.h"

/*! \file  esk_stack.h
    \brief Implementation of LIFO container: Stack.
*/

namespace esk {

/*! \class  Stack
    \brief  Last-In-First-Out container with amortized growth.
    \tparam T Data type of elements (default-constructible, copy-assignable).

    Storage is allocated on the first \c Push() (ESK_STACK_CAPACITY_INITIAL elements) and doubles
    every time the stack becomes full, therefore there is no capacity limit other than available memory.
    Allocation failure is reported with RESULT_NO_MEMORY and leaves the stack unchanged.

    \code
    esk::Stack<int32_t> stack;

    stack.Push(1);
    stack.Push(2);

    int32_t top;
    while (stack.Pop(top) == esk::RESULT_OK) {
        // 2, then 1
    }
    \endcode

    \note  Not thread-safe, guard with a critical section if shared between contexts.
*/
template <typename T>
class Stack
{
public:
    /*! \brief     Constructor.
    */
    explicit Stack() : m_items(NULL), m_size(0), m_capacity(0)
    {
        ESK_STATIC_ASSERT(ESK_STACK_CAPACITY_INITIAL > 0);
    }

    /*! \brief     Destructor.
    */
    ~Stack() { delete [] m_items; }

    /*! \brief     Push element on top of the stack.
        \param[in] value: Value to copy into the stack.
        \return    RESULT_OK, or RESULT_NO_MEMORY if storage could not grow.
    */
    EResult Push(const T &value)
    {
        if (m_size == m_capacity)
        {
            EResult result = Grow();
            if (result != RESULT_OK)
                return result;
        }

        m_items[m_size++] = value;
        return RESULT_OK;
    }

    /*! \brief      Remove element from the top of the stack.
        \param[out] value: Variable where the most recently pushed element is stored.
        \return     RESULT_OK, or RESULT_EMPTY_STACK if stack has no elements (value is untouched).
    */
    EResult Pop(T &value)
    {
        if (m_size == 0)
            return RESULT_EMPTY_STACK;

        value = m_items[--m_size];
        return RESULT_OK;
    }

    /*! \brief      Read element from the top of the stack without removing it.
        \param[out] value: Variable where the top element is stored.
        \return     RESULT_OK, or RESULT_EMPTY_STACK if stack has no elements (value is untouched).
    */
    EResult Peek(T &value) const
    {
        if (m_size == 0)
            return RESULT_EMPTY_STACK;

        value = m_items[m_size - 1];
        return RESULT_OK;
    }

    bool IsEmpty() const { return (m_size == 0); }
    size_t GetSize() const { return m_size; }
    size_t GetCapacity() const { return m_capacity; }

private:
    Stack(const Stack &);
    Stack &operator=(const Stack &);

    EResult Grow()
    {
        size_t capacity = (m_capacity == 0 ? ESK_STACK_CAPACITY_INITIAL : m_capacity * 2);

        // overflow of the doubled capacity
        if (capacity <= m_capacity)
            return RESULT_NO_MEMORY;

        T *items = new (std::nothrow) T[capacity];
        if (items == NULL)
            return RESULT_NO_MEMORY;

        for (size_t i = 0; i < m_size; ++i)
            items[i] = m_items[i];

        delete [] m_items;

        m_items    = items;
        m_capacity = capacity;
        return RESULT_OK;
    }

    T     *m_items;    //!< storage, m_items[m_size - 1] is the top
    size_t m_size;     //!< number of stored elements
    size_t m_capacity; //!< number of allocated elements
};

} // namespace esk

#endif /* ESK_STACK_H_ */
