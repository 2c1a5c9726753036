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

#include "config_fields.h"

#include <cstring>

namespace icmd {
namespace counter {

using protocol::RegisterId;

static constexpr FieldInfo FIELDS[] = {
    {ConfigField::COUNTER_LAYOUT, "counter_layout", RegisterId::COUNTER_CONFIG,   0, 3},
    {ConfigField::DIRECTION_0,    "direction_0",    RegisterId::COUNTER_CONFIG,   3, 1},
    {ConfigField::DIRECTION_1,    "direction_1",    RegisterId::COUNTER_CONFIG,   4, 1},
    {ConfigField::DIRECTION_2,    "direction_2",    RegisterId::COUNTER_CONFIG,   5, 1},
    {ConfigField::Z_INVERT_0,     "z_invert_0",     RegisterId::COUNTER_CONFIG,   6, 1},
    {ConfigField::Z_INVERT_1,     "z_invert_1",     RegisterId::COUNTER_CONFIG,   7, 1},
    {ConfigField::SPI_PRIORITY,   "spi_priority",   RegisterId::INTERFACE_CONFIG, 0, 1},
    {ConfigField::TTL_INPUTS,     "ttl_inputs",     RegisterId::INTERFACE_CONFIG, 7, 1},
};

static_assert(sizeof(FIELDS) / sizeof(FIELDS[0]) == static_cast<size_t>(ConfigField::COUNT),
              "every config field needs a table entry");

const FieldInfo* field_info(ConfigField field)
{
    const auto index = static_cast<size_t>(field);
    if (index >= static_cast<size_t>(ConfigField::COUNT)) {
        return nullptr;
    }
    return &FIELDS[index];
}

bool parse_field(const char* name, ConfigField* field)
{
    for (const FieldInfo& info : FIELDS) {
        if (strcmp(info.name, name) == 0) {
            *field = info.field;
            return true;
        }
    }
    return false;
}

uint64_t insert_field(uint64_t reg_value, const FieldInfo& info, uint32_t value)
{
    return (reg_value & ~info.mask()) | ((uint64_t(value) << info.shift) & info.mask());
}

uint32_t extract_field(uint64_t reg_value, const FieldInfo& info)
{
    return static_cast<uint32_t>((reg_value & info.mask()) >> info.shift);
}

uint8_t counter_config_byte(const CounterSetup& setup)
{
    uint64_t reg = 0;
    reg = insert_field(reg, FIELDS[0], static_cast<uint32_t>(setup.layout));

    for (size_t ch = 0; ch < MAX_CHANNELS; ++ch) {
        const FieldInfo& dir = FIELDS[static_cast<size_t>(ConfigField::DIRECTION_0) + ch];
        reg = insert_field(reg, dir, static_cast<uint32_t>(setup.channels[ch].direction));
    }

    for (size_t ch = 0; ch < 2; ++ch) {
        const FieldInfo& z = FIELDS[static_cast<size_t>(ConfigField::Z_INVERT_0) + ch];
        reg = insert_field(reg, z, static_cast<uint32_t>(setup.channels[ch].z_signal));
    }

    return static_cast<uint8_t>(reg);
}

uint8_t interface_config_byte(const CounterSetup& setup)
{
    uint64_t reg = 0;
    reg = insert_field(reg, *field_info(ConfigField::SPI_PRIORITY), setup.spi_priority ? 1 : 0);
    reg = insert_field(reg, *field_info(ConfigField::TTL_INPUTS), setup.ttl_inputs ? 1 : 0);
    return static_cast<uint8_t>(reg);
}

} // namespace counter
} // namespace icmd
