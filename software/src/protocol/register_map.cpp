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

#include "register_map.h"

namespace icmd {
namespace protocol {

// Indexed by RegisterId
static constexpr RegisterInfo REGISTER_MAP[] = {
    {RegisterId::COUNTER_CONFIG,   "COUNTER_CONFIG",   0x00, 1, Access::RW},
    {RegisterId::INTERFACE_CONFIG, "INTERFACE_CONFIG", 0x01, 1, Access::RW},
    {RegisterId::COUNTER_1x24,     "COUNTER_1x24",     0x08, 4, Access::RO},  // 24 + status
    {RegisterId::COUNTER_2x24,     "COUNTER_2x24",     0x08, 7, Access::RO},  // 24 + 24 + status
    {RegisterId::COUNTER_1x48,     "COUNTER_1x48",     0x08, 7, Access::RO},  // 48 + status
    {RegisterId::COUNTER_1x16,     "COUNTER_1x16",     0x08, 3, Access::RO},  // 16 + status
    {RegisterId::COUNTER_1x32,     "COUNTER_1x32",     0x08, 5, Access::RO},  // 32 + status
    {RegisterId::COUNTER_32_16,    "COUNTER_32_16",    0x08, 7, Access::RO},  // 32 + 16 + status
    {RegisterId::COUNTER_2x16,     "COUNTER_2x16",     0x08, 5, Access::RO},  // 16 + 16 + status
    {RegisterId::COUNTER_3x16,     "COUNTER_3x16",     0x08, 7, Access::RO},  // 16 + 16 + 16 + status
    {RegisterId::REFERENCE,        "REFERENCE",        0x10, 3, Access::RO},
    {RegisterId::TOUCH_PROBE_1,    "TOUCH_PROBE_1",    0x20, 6, Access::RO},
    {RegisterId::TOUCH_PROBE_2,    "TOUCH_PROBE_2",    0x28, 6, Access::RO},
    {RegisterId::INSTRUCTION,      "INSTRUCTION",      0x30, 1, Access::WO},
    {RegisterId::STATUS_0,         "STATUS_0",         0x48, 1, Access::RO},
    {RegisterId::STATUS_1,         "STATUS_1",         0x49, 1, Access::RO},
    {RegisterId::STATUS_2,         "STATUS_2",         0x4A, 1, Access::RO},
    {RegisterId::DEVICE_ID,        "DEVICE_ID",        0x78, 1, Access::RO},
};

static_assert(sizeof(REGISTER_MAP) / sizeof(REGISTER_MAP[0]) ==
              static_cast<size_t>(RegisterId::COUNT),
              "register map must cover every RegisterId");

static constexpr bool map_is_ordered()
{
    for (size_t i = 0; i < static_cast<size_t>(RegisterId::COUNT); ++i) {
        if (static_cast<size_t>(REGISTER_MAP[i].id) != i) return false;
        if (REGISTER_MAP[i].width == 0 || REGISTER_MAP[i].width > MAX_REGISTER_WIDTH) return false;
        if (REGISTER_MAP[i].address > ADDRESS_MASK) return false;
    }
    return true;
}

static_assert(map_is_ordered(), "register map entries out of order or malformed");

const RegisterInfo* register_info(RegisterId id)
{
    const auto index = static_cast<size_t>(id);
    if (index >= static_cast<size_t>(RegisterId::COUNT)) {
        return nullptr;
    }
    return &REGISTER_MAP[index];
}

const char* register_name(RegisterId id)
{
    const RegisterInfo* info = register_info(id);
    return info != nullptr ? info->name : "?";
}

} // namespace protocol
} // namespace icmd
