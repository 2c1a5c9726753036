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

#pragma once

#include <atomic>
#include <cstdint>

#include "../counter/config_fields.h"
#include "../counter/counter_value.h"
#include "../counter/device_status.h"
#include "../platform/transport.h"
#include "../protocol/error.h"
#include "../protocol/register_engine.h"

namespace icmd {
namespace core {

//
// Device - public API for one iC-MD on one transport
//
// All operations are synchronous and hold the bus for their whole
// duration. The only state kept on the host is the actuator pin levels,
// since the instruction register cannot be read back; every instruction
// write carries them so latching or resetting never drops an output.
//
class Device {
public:
    explicit Device(platform::Transport* transport);

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    // Write both configuration registers from setup
    protocol::Status init(const counter::CounterSetup& setup);

    // DECODE_INCONSISTENCY unless DEVICE_ID reads 'M'
    protocol::Status probe();

    // Latch counter 0 and read it back as one coherent signed value,
    // sign-extended from counter 0's width in the layout the chip reports
    protocol::Result<int64_t> read_counter();

    // Burst read of the live counters in the layout currently configured
    // on the chip. The layout is read from the chip first, never cached.
    protocol::Result<counter::CounterReading> read_counters();

    // Read-modify-write of one configuration field
    protocol::Status write_config(counter::ConfigField field, uint32_t value);
    protocol::Result<uint32_t> read_config(counter::ConfigField field);

    protocol::Status reset_counters(bool counter0, bool counter1, bool counter2);
    protocol::Status reset_all_counters() { return reset_counters(true, true, true); }

    // Levels are remembered only once the write succeeded
    protocol::Status set_actuator_pins(bool act0, bool act1);
    bool actuator0() const { return (actuator_bits_.load() & protocol::INSTR_ACT0) != 0; }
    bool actuator1() const { return (actuator_bits_.load() & protocol::INSTR_ACT1) != 0; }

    // Copy counter 0 to TOUCH_PROBE_1 (and TOUCH_PROBE_1 to TOUCH_PROBE_2)
    protocol::Status touch_probe();

    // Value captured in TOUCH_PROBE_1 or TOUCH_PROBE_2 (index 1 or 2).
    // read_counter() latches through the same registers, so a capture is
    // only readable until the next read_counter().
    protocol::Result<int64_t> read_touch_probe(int index);

    // Reference register, 24-bit signed
    protocol::Result<int64_t> read_reference();

    protocol::Result<counter::FullStatus> read_full_status();

    // Status byte of the most recent successful burst
    counter::DeviceStatus device_status() const;

    // Turn an asserted nERR in a burst into DECODE_INCONSISTENCY
    void set_fail_on_device_error(bool fail) { fail_on_device_error_ = fail; }

    void set_read_chunk_bytes(size_t bytes) { engine_.set_read_chunk_bytes(bytes); }

    protocol::RegisterEngine& engine() { return engine_; }

private:
    protocol::Status write_instruction(uint8_t bits);
    protocol::Result<unsigned> counter0_bits();

    protocol::RegisterEngine engine_;
    std::atomic<uint8_t> actuator_bits_{0};
    std::atomic<uint8_t> last_status_{0xC0};
    bool fail_on_device_error_ = false;
};

} // namespace core
} // namespace icmd
