/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License version 2 for more details.
 *
 * You should have received a copy of the GNU General Public License
 * version 2 along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 *
 */

// Decoded STATUS_0 / STATUS_1 / STATUS_2
#pragma once

#include <cstdint>
#include <string>

#include "counter_value.h"

namespace icmd {
namespace counter {

struct FullStatus {
    // Per counter
    bool overflow[MAX_CHANNELS] = {};
    bool ab_error[MAX_CHANNELS] = {};
    bool zero[MAX_CHANNELS] = {};

    // STATUS_0
    bool touch_probe_updated = false;
    bool reference_overflow = false;
    bool upd_valid = false;
    bool reference_valid = false;
    bool power_down = false;        // Undervoltage reset since last status read

    // STATUS_1
    bool tpi_high = false;          // Level of the touch probe input pin

    // STATUS_1 / STATUS_2 (either register)
    bool com_collision = false;
    bool ext_warning = false;
    bool ext_error = false;

    // STATUS_2
    bool ssi_enabled = false;

    // No error condition set; zero flags, tpi and valid bits are informational
    bool ok() const;

    // Comma separated list of set error flags, "ok" if none
    std::string describe() const;
};

FullStatus decode_full_status(uint8_t status0, uint8_t status1, uint8_t status2);

} // namespace counter
} // namespace icmd
