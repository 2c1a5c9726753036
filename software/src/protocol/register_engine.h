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

// Register protocol engine: framing, decoding and the latch-then-read sequence
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.h"
#include "frame.h"
#include "register_map.h"
#include "../platform/transport.h"
#include "../util/mutex.h"

namespace icmd {
namespace protocol {

//
// RegisterEngine - owns all traffic to one chip on one transport
//
// Every public operation holds the bus mutex for its full duration, so
// a latch and the reads that follow it can never be split by another
// caller. BusLock extends that ownership over several operations.
//
class RegisterEngine {
public:
    explicit RegisterEngine(platform::Transport* transport);
    ~RegisterEngine();

    RegisterEngine(const RegisterEngine&) = delete;
    RegisterEngine& operator=(const RegisterEngine&) = delete;

    // One write transfer; value must fit the register width
    Status write_register(RegisterId id, uint64_t value);

    // One read transfer, decoded big-endian
    Result<uint64_t> read_register(RegisterId id);

    // One read transfer, raw bytes in wire order (burst decoding)
    Status read_register_bytes(RegisterId id, std::vector<uint8_t>* bytes);

    // Latch counter 0 into the shadow register, then read the shadow
    // register back. `persistent_bits` (ACT0/ACT1 only) are carried in the
    // latch instruction so it does not disturb the actuator outputs.
    // Returns the raw 48-bit pattern; nothing is returned unless every
    // read after the latch succeeded.
    Result<uint64_t> read_counter_snapshot(uint8_t persistent_bits = 0);

    // Bytes per read transfer of the shadow register; 0 = whole register
    void set_read_chunk_bytes(size_t bytes) { chunk_bytes_ = bytes; }
    size_t read_chunk_bytes() const { return chunk_bytes_; }

    // Transfers issued since construction (diagnostics)
    uint64_t transfer_count() const { return transfer_count_.load(); }

private:
    friend class BusLock;

    Status transact(const CommandFrame& frame, RegisterId id, std::vector<uint8_t>* response);

    platform::Transport* transport_;
    mutex bus_;
    size_t chunk_bytes_ = 0;
    std::atomic<uint64_t> transfer_count_{0};
    std::vector<uint8_t> scratch_;
};

//
// BusLock - hold the engine's bus across several operations
// (read-modify-write, configuration read followed by a burst)
//
class BusLock {
public:
    explicit BusLock(RegisterEngine& engine) : guard_(&engine.bus_) {}

private:
    MutexGuard guard_;
};

} // namespace protocol
} // namespace icmd
