/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESKTEST_H_
#define ESKTEST_H_

#include <stdio.h>
#include <string.h>
#include <exception>

// lib: esk
// note: included before CppUTest, its memory leak macros redefine operator new used by esk::Stack
#include <esk_config.h>
#include <esk.h>

// lib: cpputest
#include <CppUTest/TestHarness.h>

#include "esktest_context.h"

namespace esk {

/*! \namespace esk::test
    \brief     Namespace of the test inventory.
 */
namespace test {

/*! \class TestAssertPassed
    \brief Throwable class for catching assertions from _ESK_ASSERT_IMPL().
*/
struct TestAssertPassed : public std::exception
{
    const char *what() const noexcept { return "ESK test suite exception (TestAssertPassed) thrown!"; }
};

/*! \class RegisterFileMock
    \brief IRegisterFile mock.
*/
class RegisterFileMock : public IRegisterFile
{
public:
    explicit RegisterFileMock(uint32_t pc = 0, uint32_t sp = 0, uint32_t status = 0)
        : m_pc(pc), m_sp(sp), m_status(status), m_reads(0)
    { }

    uint32_t GetPC() const { ++m_reads; return m_pc; }
    uint32_t GetSP() const { ++m_reads; return m_sp; }
    uint32_t GetStatus() const { ++m_reads; return m_status; }

    uint32_t         m_pc;
    uint32_t         m_sp;
    uint32_t         m_status;
    mutable uint32_t m_reads;
};

/*! \class LogSinkMock
    \brief ILogSink mock which keeps received lines.
    \note  Installs itself on construction and restores previous sink on destruction.
*/
class LogSinkMock : public ILogSink
{
public:
    enum EConsts
    {
        LINES_MAX = 16,
        LINE_SIZE = 256
    };

    LogSinkMock() : m_count(0), m_last_level(-1)
    {
        memset(m_lines, 0, sizeof(m_lines));
        m_prev = log::SetSink(this);
    }

    virtual ~LogSinkMock()
    {
        log::SetSink(m_prev);
    }

    void OnLogLine(int32_t level, const char *line)
    {
        m_last_level = level;

        if (m_count < LINES_MAX)
        {
            strncpy(m_lines[m_count], line, LINE_SIZE - 1);
            m_lines[m_count][LINE_SIZE - 1] = 0;
        }

        ++m_count;
    }

    /*! \brief     Check if any of received lines contains text.
    */
    bool Contains(const char *text) const
    {
        for (int32_t i = 0; (i < m_count) && (i < LINES_MAX); ++i)
        {
            if (strstr(m_lines[i], text) != NULL)
                return true;
        }
        return false;
    }

    char      m_lines[LINES_MAX][LINE_SIZE];
    int32_t   m_count;
    int32_t   m_last_level;
    ILogSink *m_prev;
};

} // namespace test
} // namespace esk

#endif /* ESKTEST_H_ */
