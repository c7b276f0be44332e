// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Unit conversion factors used by the report decoder
 */

#pragma once

/** Knots to statute miles per hour */
#define MG_KT_TO_MPH      1.1508

/** Meters per second to statute miles per hour */
#define MG_MPS_TO_MPH     2.23694

/** Kilometers per hour to statute miles per hour */
#define MG_KMH_TO_MPH     0.621371

/**
 * Divisor turning a four digit metric visibility group into the
 * reported mileage (0400 -> 0.6 mi, 9999 -> 16 mi).
 */
#define MG_VIS_METER_DIVISOR 621.4

/** Hectopascal to inches of mercury */
#define MG_HPA_TO_INHG    0.02953

/** Visibility reported for CAVOK, in statute miles */
#define MG_CAVOK_VISIBILITY_SM 7.0
