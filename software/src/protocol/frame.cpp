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

#include "frame.h"

#include <tinyformat.h>

namespace icmd {
namespace protocol {

uint64_t decode_be(const uint8_t* bytes, size_t len)
{
    uint64_t value = 0;
    for (size_t i = 0; i < len; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

void encode_be(uint64_t value, size_t len, uint8_t* out)
{
    for (size_t i = 0; i < len; ++i) {
        out[len - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

bool fits_width(uint64_t value, size_t width_bytes)
{
    if (width_bytes >= 8) return true;
    return (value >> (8 * width_bytes)) == 0;
}

Result<CommandFrame> build_read_frame(RegisterId id)
{
    const RegisterInfo* info = register_info(id);
    if (info == nullptr) {
        return protocol_violation(tfm::format("unknown register id %d", static_cast<int>(id)));
    }
    return build_read_chunk_frame(id, 0, info->width);
}

Result<CommandFrame> build_read_chunk_frame(RegisterId id, size_t offset, size_t length)
{
    const RegisterInfo* info = register_info(id);
    if (info == nullptr) {
        return protocol_violation(tfm::format("unknown register id %d", static_cast<int>(id)));
    }
    if (!can_read(info->access)) {
        return protocol_violation(tfm::format("%s is write-only", info->name));
    }
    if (length == 0 || offset + length > info->width) {
        return protocol_violation(tfm::format("read of %u bytes at offset %u exceeds %s width %u",
                                              length, offset, info->name, info->width));
    }

    const size_t address = info->address + offset;
    if (address > ADDRESS_MASK) {
        return protocol_violation(tfm::format("address 0x%02x out of range", address));
    }

    CommandFrame frame;
    frame.bytes.push_back(static_cast<uint8_t>(OPCODE_READ | address));
    frame.response_length = length;
    return frame;
}

Result<CommandFrame> build_write_frame(RegisterId id, uint64_t value)
{
    const RegisterInfo* info = register_info(id);
    if (info == nullptr) {
        return protocol_violation(tfm::format("unknown register id %d", static_cast<int>(id)));
    }
    if (!can_write(info->access)) {
        return protocol_violation(tfm::format("%s is read-only", info->name));
    }
    if (!fits_width(value, info->width)) {
        return protocol_violation(tfm::format("value 0x%x exceeds %u-byte register %s",
                                              value, info->width, info->name));
    }

    CommandFrame frame;
    frame.bytes.resize(1 + info->width);
    frame.bytes[0] = info->address;
    encode_be(value, info->width, &frame.bytes[1]);
    frame.response_length = 0;
    return frame;
}

} // namespace protocol
} // namespace icmd
