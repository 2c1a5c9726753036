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

// Command frame encoding for the iC-MD SPI protocol
//
// Read:  [0x80 | addr]            -> width response bytes
// Write: [addr] [MSB ... LSB]     -> no response bytes
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.h"
#include "register_map.h"

namespace icmd {
namespace protocol {

struct CommandFrame {
    std::vector<uint8_t> bytes;   // Opcode followed by any write payload
    size_t response_length = 0;   // Bytes the transport must return
};

// Whole-register read. Fails for unknown ids and write-only registers.
Result<CommandFrame> build_read_frame(RegisterId id);

// Partial read of `length` bytes starting `offset` bytes into the register,
// addressed as (address + offset). Used for multi-transfer shadow reads.
Result<CommandFrame> build_read_chunk_frame(RegisterId id, size_t offset, size_t length);

// Fails for unknown ids, read-only registers and values wider than the register.
Result<CommandFrame> build_write_frame(RegisterId id, uint64_t value);

// Big-endian helpers; len <= 8
uint64_t decode_be(const uint8_t* bytes, size_t len);
void encode_be(uint64_t value, size_t len, uint8_t* out);

// True if value fits in width_bytes bytes
bool fits_width(uint64_t value, size_t width_bytes);

} // namespace protocol
} // namespace icmd
