/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "counter/counter_value.h"
#include "platform/transport.h"

namespace icmd {
namespace test {

//
// SimulatedChip - in-memory iC-MD answering on the Transport interface
//
// Implements the register file the driver touches: configuration,
// counter bursts for every layout, touch probe shadows, instruction
// handling (reset, touch probe, actuators), reference, status and id.
// Counter 0 can be made to move on every transfer to expose torn reads.
//
class SimulatedChip : public platform::Transport {
public:
    SimulatedChip() = default;

    protocol::Status transfer(const std::vector<uint8_t>& command,
                              size_t response_length,
                              std::vector<uint8_t>* response) override;

    // === Chip state ===
    int64_t counters[counter::MAX_CHANNELS] = {};
    int64_t reference = 0;
    uint64_t touch_probe_1 = 0;     // 48-bit raw
    uint64_t touch_probe_2 = 0;
    uint8_t counter_config = 0;
    uint8_t interface_config = 0;
    uint8_t status[3] = {};
    uint8_t device_id = 'M';
    bool nerr = false;              // Drive nERR low in bursts
    bool nwarn = false;             // Drive nWARN low in bursts

    // Added to counter 0 after every transfer
    int64_t motion_per_transfer = 0;

    // Every transfer fails with TRANSPORT_FAULT
    bool unplugged = false;

    // Last instruction byte written and the persistent actuator bits
    uint8_t last_instruction = 0;
    uint8_t actuators = 0;

    // === Traffic ===
    const std::vector<std::vector<uint8_t>>& commands() const { return commands_; }
    size_t transfer_count() const { return commands_.size(); }
    void clear_log() { commands_.clear(); }

private:
    void write(uint8_t address, const uint8_t* payload, size_t len);
    std::vector<uint8_t> read(uint8_t address, size_t len) const;
    std::vector<uint8_t> burst() const;

    std::vector<std::vector<uint8_t>> commands_;
};

} // namespace test
} // namespace icmd
