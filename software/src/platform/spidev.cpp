/*
 * Copyright (C) 2019 Andrew Tait <rasteri@gmail.com>
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


// SPI transport over the Linux spidev interface

#include "transport.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>

#include <tinyformat.h>

#include "../util/log.h"

namespace icmd {
namespace platform {

SpidevTransport::~SpidevTransport()
{
    close();
}

bool SpidevTransport::open(const SpiConfig& config)
{
    close();

    int fd = ::open(config.device, O_RDWR);
    if (fd < 0) {
        LOG_WARN("%s - Failed to open: %s", config.device, strerror(errno));
        return false;
    }

    uint8_t mode = config.mode;
    uint8_t bits = config.bits_per_word;
    uint32_t speed = config.speed_hz;

    if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0) {
        LOG_WARN("%s - Failed to set SPI mode %d: %s", config.device, mode, strerror(errno));
        ::close(fd);
        return false;
    }

    if (ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
        LOG_WARN("%s - Failed to set %d bits per word: %s", config.device, bits, strerror(errno));
        ::close(fd);
        return false;
    }

    if (ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        LOG_WARN("%s - Failed to set clock %u Hz: %s", config.device, speed, strerror(errno));
        ::close(fd);
        return false;
    }

    fd_ = fd;
    config_ = config;

    LOG_INFO("%s - SPI mode %d, %u Hz", config.device, mode, speed);
    return true;
}

void SpidevTransport::close()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

protocol::Status SpidevTransport::transfer(const std::vector<uint8_t>& command,
                                           size_t response_length,
                                           std::vector<uint8_t>* response)
{
    if (fd_ < 0) {
        return protocol::transport_fault("SPI device not open");
    }

    response->assign(response_length, 0);

    struct spi_ioc_transfer xfer[2];
    memset(xfer, 0, sizeof(xfer));

    xfer[0].tx_buf = reinterpret_cast<uintptr_t>(command.data());
    xfer[0].len = static_cast<uint32_t>(command.size());
    xfer[0].speed_hz = config_.speed_hz;
    xfer[0].bits_per_word = config_.bits_per_word;
    xfer[0].cs_change = 0;

    size_t expected = command.size();
    int r;

    if (response_length > 0) {
        xfer[1].rx_buf = reinterpret_cast<uintptr_t>(response->data());
        xfer[1].len = static_cast<uint32_t>(response_length);
        xfer[1].speed_hz = config_.speed_hz;
        xfer[1].bits_per_word = config_.bits_per_word;
        expected += response_length;
        r = ioctl(fd_, SPI_IOC_MESSAGE(2), xfer);
    } else {
        r = ioctl(fd_, SPI_IOC_MESSAGE(1), xfer);
    }

    if (r < 0) {
        response->clear();
        return protocol::transport_fault(tfm::format("%s: SPI_IOC_MESSAGE failed: %s",
                                                     config_.device, strerror(errno)));
    }

    if (static_cast<size_t>(r) != expected) {
        // Keep only what actually crossed the wire after the command
        size_t received = static_cast<size_t>(r) > command.size()
                        ? static_cast<size_t>(r) - command.size() : 0;
        response->resize(received < response_length ? received : response_length);
    }

    return protocol::Status::success();
}

} // namespace platform
} // namespace icmd
