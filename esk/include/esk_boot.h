/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#ifndef ESK_BOOT_H_
#define ESK_BOOT_H_

#include "esk_common.h"

/*! \file  esk_boot.h
    \brief Reset-to-main boot sequence simulation: BootTrace, BootImage, BootSequence.
*/

namespace esk {

/*! \enum  EBootStage
    \brief Stages of the Cortex-M style reset sequence in the order they are executed.
*/
enum EBootStage
{
    BOOT_STAGE_LOAD_SP = 0,        //!< core loads initial SP from vector table entry 0
    BOOT_STAGE_LOAD_RESET_VECTOR,  //!< core loads PC from vector table entry 1 (Reset_Handler)
    BOOT_STAGE_COPY_DATA,          //!< Reset_Handler copies .data initializers from flash to RAM
    BOOT_STAGE_ZERO_BSS,           //!< Reset_Handler zero-fills .bss
    BOOT_STAGE_SYSTEM_INIT,        //!< SystemInit() configures clocks (optional)
    BOOT_STAGE_INIT_ARRAY,         //!< static constructors from .init_array are called
    BOOT_STAGE_MAIN,               //!< main() is called
    BOOT_STAGE_COUNT               //!< number of stages (not a stage)
};

/*! \brief     Get printable name of the boot stage.
    \return    Null-terminated constant string, "unknown" for the value outside EBootStage.
*/
const char *GetBootStageName(EBootStage stage);

/*! \class BootTraceEntry
    \brief One recorded boot stage.
*/
struct BootTraceEntry
{
    EBootStage stage;  //!< stage
    uint32_t   detail; //!< stage-specific value (address or byte count)
};

/*! \class BootTrace
    \brief Ordered log of boot stages.

    Entries are kept in the order of \c Record() calls. Capacity is ESK_BOOT_TRACE_CAPACITY entries.
*/
class BootTrace
{
public:
    enum { CAPACITY = ESK_BOOT_TRACE_CAPACITY };

    explicit BootTrace() : m_entries(), m_size(0)
    {}

    /*! \brief     Append stage to the trace.
        \param[in] stage: Stage to record.
        \param[in] detail: Stage-specific value.
        \return    \c true if recorded, \c false if trace is full.
    */
    bool Record(EBootStage stage, uint32_t detail = 0)
    {
        if (m_size == (size_t)CAPACITY)
            return false;

        m_entries[m_size].stage  = stage;
        m_entries[m_size].detail = detail;
        ++m_size;

        return true;
    }

    /*! \brief     Get recorded entry.
        \param[in] index: Index of the entry, must be lower than GetSize().
    */
    const BootTraceEntry &GetEntry(size_t index) const
    {
        ESK_ASSERT(index < m_size);
        return m_entries[index];
    }

    /*! \brief     Get stage of the recorded entry.
        \param[in] index: Index of the entry, must be lower than GetSize().
    */
    EBootStage GetStage(size_t index) const { return GetEntry(index).stage; }

    void Clear() { m_size = 0; }
    bool IsEmpty() const { return (m_size == 0); }
    size_t GetSize() const { return m_size; }
    size_t GetFree() const { return ((size_t)CAPACITY - m_size); }

private:
    BootTraceEntry m_entries[CAPACITY]; //!< recorded entries
    size_t         m_size;              //!< number of recorded entries
};

/*! \class BootImage
    \brief Memory image seen by the reset handler: vector table, section layout and entry points.

    Section pointers refer to caller-owned memory which emulates flash (load image) and RAM.
*/
struct BootImage
{
    uint32_t             initial_sp;   //!< vector table entry 0: initial Main Stack Pointer
    uint32_t             reset_vector; //!< vector table entry 1: Reset_Handler address (Thumb bit must be set)
    const uint8_t       *data_load;    //!< .data initializers in flash (LMA)
    uint8_t             *data_ram;     //!< .data in RAM (VMA)
    size_t               data_size;    //!< size of .data in bytes
    uint8_t             *bss;          //!< .bss in RAM
    size_t               bss_size;     //!< size of .bss in bytes
    EntryFuncType        system_init;  //!< SystemInit, can be NULL
    const EntryFuncType *init_array;   //!< static constructors
    size_t               init_count;   //!< number of static constructors
    EntryFuncType        main_func;    //!< main, must be set
    void                *user_data;    //!< user data supplied to every entry point
};

/*! \class BootSequence
    \brief Simulated reset handler which brings BootImage from reset to main.

    \code
    esk::BootTrace trace;
    esk::BootSequence boot(trace);

    if (boot.Run(image) == esk::RESULT_OK) {
        // trace holds BOOT_STAGE_LOAD_SP .. BOOT_STAGE_MAIN
    }
    \endcode
*/
class BootSequence
{
public:
    /*! \brief     Constructor.
        \param[in] trace: Trace which receives executed stages.
    */
    explicit BootSequence(BootTrace &trace) : m_trace(trace), m_sp(0), m_pc(0)
    {}

    /*! \brief     Validate image and execute all boot stages.
        \param[in] image: Boot image.
        \return    RESULT_OK if main was called, RESULT_INVALID_IMAGE if image is malformed or
                   RESULT_TRACE_FULL if trace has no space for all stages. Nothing is executed
                   in case of failure.
    */
    EResult Run(const BootImage &image);

    /*! \brief     Check boot image without executing it.
        \return    \c true if image can be booted.
    */
    static bool IsValidImage(const BootImage &image);

    /*! \brief     Get Stack Pointer loaded from the vector table by the last successful Run().
    */
    uint32_t GetSP() const { return m_sp; }

    /*! \brief     Get Program Counter loaded from the vector table by the last successful Run().
    */
    uint32_t GetPC() const { return m_pc; }

private:
    BootSequence(const BootSequence &);
    BootSequence &operator=(const BootSequence &);

    void Trace(EBootStage stage, uint32_t detail);

    BootTrace &m_trace; //!< trace of the executed stages
    uint32_t   m_sp;    //!< loaded Main Stack Pointer
    uint32_t   m_pc;    //!< loaded Program Counter (Thumb bit cleared)
};

} // namespace esk

#endif /* ESK_BOOT_H_ */
