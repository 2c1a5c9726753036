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

// iC-MD register map
//
// Fixed, process-wide table: every register id has exactly one bus
// address, byte width and access capability. Addresses and widths follow
// the iC-MD datasheet register tables (SPI mode 0, MSB first).
#pragma once

#include <cstddef>
#include <cstdint>

namespace icmd {
namespace protocol {

enum class Access : uint8_t {
    RO,
    WO,
    RW
};

// Counter data views share address 0x08; the width depends on the layout
// selected in COUNTER_CONFIG and includes the trailing nERR/nWARN byte.
enum class RegisterId : uint8_t {
    COUNTER_CONFIG = 0,
    INTERFACE_CONFIG,
    COUNTER_1x24,
    COUNTER_2x24,
    COUNTER_1x48,
    COUNTER_1x16,
    COUNTER_1x32,
    COUNTER_32_16,
    COUNTER_2x16,
    COUNTER_3x16,
    REFERENCE,
    TOUCH_PROBE_1,
    TOUCH_PROBE_2,
    INSTRUCTION,
    STATUS_0,
    STATUS_1,
    STATUS_2,
    DEVICE_ID,
    COUNT
};

struct RegisterInfo {
    RegisterId id;
    const char* name;
    uint8_t address;
    uint8_t width;      // bytes on the wire
    Access access;
};

// Opcode: bit 7 set selects a read, the low 7 bits carry the address
constexpr uint8_t OPCODE_READ   = 0x80;
constexpr uint8_t ADDRESS_MASK  = 0x7F;

// Widest register on the wire (7-byte counter bursts)
constexpr size_t MAX_REGISTER_WIDTH = 7;

// Instruction register (write-only) bits
constexpr uint8_t INSTR_AB_RES0 = 0x01;  // Reset counter 0
constexpr uint8_t INSTR_AB_RES1 = 0x02;  // Reset counter 1
constexpr uint8_t INSTR_AB_RES2 = 0x04;  // Reset counter 2
constexpr uint8_t INSTR_ZC_EN   = 0x08;  // Enable zero codification
constexpr uint8_t INSTR_TP      = 0x10;  // Touch probe: TP2 <- TP1, TP1 <- counter 0
constexpr uint8_t INSTR_ACT0    = 0x20;  // Actuator pin 0 level (persistent)
constexpr uint8_t INSTR_ACT1    = 0x40;  // Actuator pin 1 level (persistent)

// Value read back from DEVICE_ID
constexpr uint8_t DEVICE_ID_VALUE = 'M';

// Shadow register captured by the touch probe (latch) instruction
constexpr RegisterId LATCH_SHADOW = RegisterId::TOUCH_PROBE_1;

// Lookup; nullptr for ids outside the table
const RegisterInfo* register_info(RegisterId id);

// Register name for log messages ("?" for unknown ids)
const char* register_name(RegisterId id);

inline bool can_read(Access access) { return access != Access::WO; }
inline bool can_write(Access access) { return access != Access::RO; }

} // namespace protocol
} // namespace icmd
