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

// Counter value model
//
// The chip counts in two's complement at 16, 24, 32 or 48 bits. Values
// are widened to int64_t by replicating the top bit of the native width;
// widening them as unsigned turns small negative counts into huge
// positive ones.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "../protocol/error.h"
#include "../protocol/register_map.h"

namespace icmd {
namespace counter {

// Native width of the latched position counter
constexpr unsigned COUNTER_BITS = 48;

constexpr int64_t COUNTER_MAX = (int64_t(1) << (COUNTER_BITS - 1)) - 1;   //  140737488355327
constexpr int64_t COUNTER_MIN = -(int64_t(1) << (COUNTER_BITS - 1));      // -140737488355328

// Sign-extend the low `bits` bits of raw (1..64); higher bits are ignored
int64_t sign_extend(uint64_t raw, unsigned bits);

// 48-bit pattern -> signed count
int64_t decode(uint64_t raw48);

// Signed count -> 48-bit pattern; value must lie in [COUNTER_MIN, COUNTER_MAX]
uint64_t encode(int64_t value);

inline bool is_representable(int64_t value)
{
    return value >= COUNTER_MIN && value <= COUNTER_MAX;
}

// Counter layouts selectable in COUNTER_CONFIG bits 0-2
enum class CounterLayout : uint8_t {
    LAYOUT_1x24  = 0,   // Counter 0 = 24 bit
    LAYOUT_2x24  = 1,   // Counters 0, 1 = 24 bit (TTL only)
    LAYOUT_1x48  = 2,   // Counter 0 = 48 bit
    LAYOUT_1x16  = 3,   // Counter 0 = 16 bit
    LAYOUT_1x32  = 4,   // Counter 0 = 32 bit
    LAYOUT_32_16 = 5,   // Counter 1 = 32 bit, counter 0 = 16 bit (TTL only)
    LAYOUT_2x16  = 6,   // Counters 0, 1 = 16 bit (TTL only)
    LAYOUT_3x16  = 7    // Counters 0, 1, 2 = 16 bit (TTL only, no Z inputs)
};

constexpr size_t MAX_CHANNELS = 3;

struct LayoutInfo {
    CounterLayout layout;
    const char* name;                   // "1x48", "32+16", ...
    protocol::RegisterId burst_register;
    uint8_t channels;
    uint8_t bits[MAX_CHANNELS];         // Width of counter 0, 1, 2
};

// nullptr for codes outside 0..7
const LayoutInfo* layout_info(CounterLayout layout);

// Accepts the names from layout_info(); false on anything else
bool parse_layout(const char* name, CounterLayout* layout);

// nERR / nWARN appended to every counter burst (both active low on the wire)
struct DeviceStatus {
    bool warning = false;
    bool error = false;

    bool ok() const { return !warning && !error; }
};

DeviceStatus decode_status_byte(uint8_t status);

// One burst read of the live counters
struct CounterReading {
    CounterLayout layout = CounterLayout::LAYOUT_1x48;
    uint8_t channels = 0;
    int64_t values[MAX_CHANNELS] = {};
    DeviceStatus status;

    // Value of counter n, or nullopt if the layout has no such counter
    std::optional<int64_t> channel(size_t n) const
    {
        if (n >= channels) return std::nullopt;
        return values[n];
    }
};

// Decode a burst in wire order: highest counter first, MSB first,
// trailing status byte. The byte count must match the layout exactly.
protocol::Result<CounterReading> decode_burst(CounterLayout layout, const std::vector<uint8_t>& bytes);

} // namespace counter
} // namespace icmd
