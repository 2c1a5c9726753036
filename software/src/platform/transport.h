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

// Byte transport abstraction for the counter chip
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../protocol/error.h"

namespace icmd {
namespace platform {

//
// Transport - one chip-select framed bus transaction
//
// Implement this for each bus backend (Linux spidev, test doubles, ...).
// A transfer asserts select, writes the whole command, reads
// response_length bytes and releases select. No other traffic may occur
// on the bus during the call. Faults are reported, never retried.
//
class Transport {
public:
    virtual ~Transport() = default;

    // On success `response` holds the bytes the bus delivered. The caller
    // checks the count; a short response is a protocol violation.
    virtual protocol::Status transfer(const std::vector<uint8_t>& command,
                                      size_t response_length,
                                      std::vector<uint8_t>* response) = 0;
};

// SPI bus parameters for spidev
struct SpiConfig {
    const char* device = "/dev/spidev0.0";
    uint32_t speed_hz = 10000000;   // iC-MD maximum
    uint8_t mode = 0;               // CPOL = 0, CPHA = 0
    uint8_t bits_per_word = 8;
};

//
// SpidevTransport - Linux /dev/spidevB.C backend
//
// Command and response are issued as a single SPI_IOC_MESSAGE with two
// segments, so chip select stays asserted between write and read.
//
class SpidevTransport : public Transport {
public:
    SpidevTransport() = default;
    ~SpidevTransport() override;

    SpidevTransport(const SpidevTransport&) = delete;
    SpidevTransport& operator=(const SpidevTransport&) = delete;

    // Open and configure the device; false (logged) on failure
    bool open(const SpiConfig& config);
    void close();

    bool is_open() const { return fd_ >= 0; }

    protocol::Status transfer(const std::vector<uint8_t>& command,
                              size_t response_length,
                              std::vector<uint8_t>* response) override;

private:
    int fd_ = -1;
    SpiConfig config_;
};

} // namespace platform
} // namespace icmd
