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

#include "counter_value.h"

#include <cstring>
#include <tinyformat.h>

#include "../protocol/frame.h"

namespace icmd {
namespace counter {

using protocol::RegisterId;

// Indexed by layout code. Burst register 0x08 returns the counters from
// the highest number down, MSB first, then the status byte. In 32+16 the
// 32-bit field is counter 1 (bits 55..24) and counter 0 is bits 23..8.
static constexpr LayoutInfo LAYOUTS[] = {
    {CounterLayout::LAYOUT_1x24,  "1x24",  RegisterId::COUNTER_1x24,  1, {24, 0, 0}},
    {CounterLayout::LAYOUT_2x24,  "2x24",  RegisterId::COUNTER_2x24,  2, {24, 24, 0}},
    {CounterLayout::LAYOUT_1x48,  "1x48",  RegisterId::COUNTER_1x48,  1, {48, 0, 0}},
    {CounterLayout::LAYOUT_1x16,  "1x16",  RegisterId::COUNTER_1x16,  1, {16, 0, 0}},
    {CounterLayout::LAYOUT_1x32,  "1x32",  RegisterId::COUNTER_1x32,  1, {32, 0, 0}},
    {CounterLayout::LAYOUT_32_16, "32+16", RegisterId::COUNTER_32_16, 2, {16, 32, 0}},
    {CounterLayout::LAYOUT_2x16,  "2x16",  RegisterId::COUNTER_2x16,  2, {16, 16, 0}},
    {CounterLayout::LAYOUT_3x16,  "3x16",  RegisterId::COUNTER_3x16,  3, {16, 16, 16}},
};

static constexpr size_t NUM_LAYOUTS = sizeof(LAYOUTS) / sizeof(LAYOUTS[0]);

// nERR = bit 7, nWARN = bit 6
constexpr uint8_t STATUS_NERR  = 0x80;
constexpr uint8_t STATUS_NWARN = 0x40;

int64_t sign_extend(uint64_t raw, unsigned bits)
{
    if (bits == 0 || bits >= 64) {
        return static_cast<int64_t>(raw);
    }

    const uint64_t mask = (uint64_t(1) << bits) - 1;
    const uint64_t sign = uint64_t(1) << (bits - 1);
    raw &= mask;

    // (raw ^ sign) - sign replicates the sign bit without shifting into it
    return static_cast<int64_t>(raw ^ sign) - static_cast<int64_t>(sign);
}

int64_t decode(uint64_t raw48)
{
    return sign_extend(raw48, COUNTER_BITS);
}

uint64_t encode(int64_t value)
{
    return static_cast<uint64_t>(value) & ((uint64_t(1) << COUNTER_BITS) - 1);
}

const LayoutInfo* layout_info(CounterLayout layout)
{
    const auto index = static_cast<size_t>(layout);
    if (index >= NUM_LAYOUTS) {
        return nullptr;
    }
    return &LAYOUTS[index];
}

bool parse_layout(const char* name, CounterLayout* layout)
{
    for (const LayoutInfo& info : LAYOUTS) {
        if (strcmp(info.name, name) == 0) {
            *layout = info.layout;
            return true;
        }
    }
    return false;
}

DeviceStatus decode_status_byte(uint8_t status)
{
    DeviceStatus s;
    s.error = (status & STATUS_NERR) == 0;
    s.warning = (status & STATUS_NWARN) == 0;
    return s;
}

protocol::Result<CounterReading> decode_burst(CounterLayout layout, const std::vector<uint8_t>& bytes)
{
    const LayoutInfo* info = layout_info(layout);
    if (info == nullptr) {
        return protocol::protocol_violation(tfm::format("unknown counter layout %d", static_cast<int>(layout)));
    }

    size_t expected = 1;
    for (uint8_t i = 0; i < info->channels; ++i) {
        expected += info->bits[i] / 8;
    }

    if (bytes.size() != expected) {
        return protocol::protocol_violation(tfm::format("%s burst needs %u bytes, got %u",
                                                        info->name, expected, bytes.size()));
    }

    CounterReading reading;
    reading.layout = layout;
    reading.channels = info->channels;

    // Highest-numbered counter comes first on the wire
    size_t pos = 0;
    for (int ch = info->channels - 1; ch >= 0; --ch) {
        const size_t len = info->bits[ch] / 8;
        const uint64_t raw = protocol::decode_be(&bytes[pos], len);
        reading.values[ch] = sign_extend(raw, info->bits[ch]);
        pos += len;
    }

    reading.status = decode_status_byte(bytes[pos]);
    return reading;
}

} // namespace counter
} // namespace icmd
