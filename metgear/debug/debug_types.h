// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Log classes and priorities
 */

#pragma once

/**
 * Define the possible classes/categories of logging messages
 */
typedef enum {
    MG_NONE        = 0x00000000,

    MG_GENERAL     = 0x00000001,
    MG_ENVIRONMENT = 0x00000002,
    MG_IO          = 0x00000004,

    MG_ALL         = 0xFFFFFFFF
} mgDebugClass;


/**
 * Define the possible logging priorities (and their order).
 *
 * Messages of MG_MANDATORY_INFO are always emitted, regardless of the
 * configured priority.
 */
typedef enum {
    MG_BULK = 1,        // For frequent messages
    MG_DEBUG,           // Less frequent debug type messages
    MG_INFO,            // Informatory messages
    MG_WARN,            // Possible impending problem
    MG_ALERT,           // Very possible impending problem
    MG_MANDATORY_INFO   // information, but should always be shown
} mgDebugPriority;
