/*
 * Embedded Study Kit (ESK): C++ companion library for embedded systems fundamentals.
 *
 * Copyright (c) 2026 ESK contributors
 * License: MIT License, see LICENSE for a full text.
 */

#include <string.h>

#include <esk_config.h>
#include "esk_boot.h"
#include "esk_log.h"

namespace esk {

// note: a single boot must always fit into the trace
ESK_STATIC_ASSERT(ESK_BOOT_TRACE_CAPACITY >= BOOT_STAGE_COUNT);

const char *GetBootStageName(EBootStage stage)
{
    switch (stage)
    {
    case BOOT_STAGE_LOAD_SP:           return "load SP";
    case BOOT_STAGE_LOAD_RESET_VECTOR: return "load reset vector";
    case BOOT_STAGE_COPY_DATA:         return "copy .data";
    case BOOT_STAGE_ZERO_BSS:          return "zero .bss";
    case BOOT_STAGE_SYSTEM_INIT:       return "SystemInit";
    case BOOT_STAGE_INIT_ARRAY:        return "init_array";
    case BOOT_STAGE_MAIN:              return "main";
    default:                           return "unknown";
    }
}

bool BootSequence::IsValidImage(const BootImage &image)
{
    // AAPCS requires 8-byte aligned stack at public interfaces
    if ((image.initial_sp == 0) || ((image.initial_sp & 0x7) != 0))
        return false;

    // Cortex-M executes Thumb code only, cleared bit 0 faults on the first instruction fetch
    if ((image.reset_vector & 0x1) == 0)
        return false;

    if ((image.data_size != 0) && ((image.data_load == NULL) || (image.data_ram == NULL)))
        return false;

    if ((image.bss_size != 0) && (image.bss == NULL))
        return false;

    if ((image.init_count != 0) && (image.init_array == NULL))
        return false;

    return (image.main_func != NULL);
}

void BootSequence::Trace(EBootStage stage, uint32_t detail)
{
    // capacity is checked in Run() before the first stage
    bool recorded = m_trace.Record(stage, detail);
    ESK_ASSERT(recorded);
    (void)recorded;
}

EResult BootSequence::Run(const BootImage &image)
{
    if (!IsValidImage(image))
    {
        ESK_LOG_ERROR("boot: invalid image (sp=0x%08x reset=0x%08x)",
            (unsigned)image.initial_sp, (unsigned)image.reset_vector);
        return RESULT_INVALID_IMAGE;
    }

    if (m_trace.GetFree() < (size_t)BOOT_STAGE_COUNT)
    {
        ESK_LOG_ERROR("boot: trace full (%u free)", (unsigned)m_trace.GetFree());
        return RESULT_TRACE_FULL;
    }

    m_sp = image.initial_sp;
    Trace(BOOT_STAGE_LOAD_SP, m_sp);

    m_pc = image.reset_vector & ~(uint32_t)0x1;
    Trace(BOOT_STAGE_LOAD_RESET_VECTOR, m_pc);

    if (image.data_size != 0)
        memcpy(image.data_ram, image.data_load, image.data_size);
    Trace(BOOT_STAGE_COPY_DATA, (uint32_t)image.data_size);

    if (image.bss_size != 0)
        memset(image.bss, 0, image.bss_size);
    Trace(BOOT_STAGE_ZERO_BSS, (uint32_t)image.bss_size);

    if (image.system_init != NULL)
        image.system_init(image.user_data);
    Trace(BOOT_STAGE_SYSTEM_INIT, (image.system_init != NULL ? 1 : 0));

    for (size_t i = 0; i < image.init_count; ++i)
        image.init_array[i](image.user_data);
    Trace(BOOT_STAGE_INIT_ARRAY, (uint32_t)image.init_count);

    Trace(BOOT_STAGE_MAIN, 0);
    ESK_LOG_DEBUG("boot: sp=0x%08x pc=0x%08x, entering main", (unsigned)m_sp, (unsigned)m_pc);

    image.main_func(image.user_data);

    return RESULT_OK;
}

} // namespace esk
