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

#include "device_status.h"

#include <tinyformat.h>

namespace icmd {
namespace counter {

// STATUS_0
constexpr uint8_t S0_TP_VALID   = 0x01;
constexpr uint8_t S0_OVF_REF    = 0x02;
constexpr uint8_t S0_UPD_VALID  = 0x04;
constexpr uint8_t S0_REF_VALID  = 0x08;

// Common to all three
constexpr uint8_t S_PDWN        = 0x10;
constexpr uint8_t S_ZERO        = 0x20;
constexpr uint8_t S_OVF         = 0x40;
constexpr uint8_t S_AB_ERR      = 0x80;

// STATUS_1 / STATUS_2
constexpr uint8_t S1_TPI        = 0x01;
constexpr uint8_t S2_EN_SSI     = 0x01;
constexpr uint8_t S12_COM_COL   = 0x02;
constexpr uint8_t S12_EXT_WARN  = 0x04;
constexpr uint8_t S12_EXT_ERR   = 0x08;

FullStatus decode_full_status(uint8_t status0, uint8_t status1, uint8_t status2)
{
    FullStatus s;
    const uint8_t regs[MAX_CHANNELS] = {status0, status1, status2};

    for (size_t i = 0; i < MAX_CHANNELS; ++i) {
        s.overflow[i] = regs[i] & S_OVF;
        s.ab_error[i] = regs[i] & S_AB_ERR;
        s.zero[i] = regs[i] & S_ZERO;
    }

    s.touch_probe_updated = status0 & S0_TP_VALID;
    s.reference_overflow = status0 & S0_OVF_REF;
    s.upd_valid = status0 & S0_UPD_VALID;
    s.reference_valid = status0 & S0_REF_VALID;
    s.power_down = (status0 | status1 | status2) & S_PDWN;

    s.tpi_high = status1 & S1_TPI;
    s.ssi_enabled = status2 & S2_EN_SSI;

    s.com_collision = (status1 | status2) & S12_COM_COL;
    s.ext_warning = (status1 | status2) & S12_EXT_WARN;
    s.ext_error = (status1 | status2) & S12_EXT_ERR;

    return s;
}

bool FullStatus::ok() const
{
    for (size_t i = 0; i < MAX_CHANNELS; ++i) {
        if (overflow[i] || ab_error[i]) return false;
    }
    return !reference_overflow && !power_down && !com_collision && !ext_warning && !ext_error;
}

std::string FullStatus::describe() const
{
    std::string out;
    auto add = [&out](const std::string& flag) {
        if (!out.empty()) out += ", ";
        out += flag;
    };

    for (size_t i = 0; i < MAX_CHANNELS; ++i) {
        if (overflow[i]) add(tfm::format("overflow %d", i));
        if (ab_error[i]) add(tfm::format("ab error %d", i));
    }
    if (reference_overflow) add("reference overflow");
    if (power_down) add("power down");
    if (com_collision) add("communication collision");
    if (ext_warning) add("external warning");
    if (ext_error) add("external error");

    return out.empty() ? "ok" : out;
}

} // namespace counter
} // namespace icmd
