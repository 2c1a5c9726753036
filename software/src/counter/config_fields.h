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

// Named configuration fields and their bit ranges in the config registers
#pragma once

#include <cstdint>

#include "counter_value.h"
#include "../protocol/register_map.h"

namespace icmd {
namespace counter {

enum class ConfigField : uint8_t {
    COUNTER_LAYOUT = 0,   // COUNTER_CONFIG bits 0-2
    DIRECTION_0,          // COUNTER_CONFIG bit 3, 1 = CCW
    DIRECTION_1,          // COUNTER_CONFIG bit 4
    DIRECTION_2,          // COUNTER_CONFIG bit 5
    Z_INVERT_0,           // COUNTER_CONFIG bit 6, 1 = inverted
    Z_INVERT_1,           // COUNTER_CONFIG bit 7
    SPI_PRIORITY,         // INTERFACE_CONFIG bit 0
    TTL_INPUTS,           // INTERFACE_CONFIG bit 7, 1 = TTL, 0 = RS-422
    COUNT
};

struct FieldInfo {
    ConfigField field;
    const char* name;
    protocol::RegisterId reg;
    uint8_t shift;
    uint8_t bits;

    uint32_t max_value() const { return (1u << bits) - 1; }
    uint64_t mask() const { return uint64_t((1u << bits) - 1) << shift; }
};

// nullptr for ids outside the table
const FieldInfo* field_info(ConfigField field);

// Lower-case names ("counter_layout", "direction_0", ...)
bool parse_field(const char* name, ConfigField* field);

// Replace the field's bits in reg_value; value must be <= max_value()
uint64_t insert_field(uint64_t reg_value, const FieldInfo& info, uint32_t value);
uint32_t extract_field(uint64_t reg_value, const FieldInfo& info);

enum class Direction : uint8_t {
    CW = 0,
    CCW = 1
};

enum class ZSignal : uint8_t {
    NORMAL = 0,
    INVERTED = 1
};

struct CounterChannelSetup {
    Direction direction = Direction::CW;
    ZSignal z_signal = ZSignal::NORMAL;
};

// Everything init() writes to the two configuration registers
struct CounterSetup {
    CounterLayout layout = CounterLayout::LAYOUT_1x48;
    CounterChannelSetup channels[MAX_CHANNELS];
    bool ttl_inputs = false;
    bool spi_priority = false;
};

// COUNTER_CONFIG byte for a setup. Counter 2 has no Z input, so its
// z_signal is ignored.
uint8_t counter_config_byte(const CounterSetup& setup);

// INTERFACE_CONFIG byte for a setup
uint8_t interface_config_byte(const CounterSetup& setup);

} // namespace counter
} // namespace icmd
