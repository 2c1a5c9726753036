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

#include <cstddef>
#include <cstdint>
#include <string>

#include "../counter/config_fields.h"

namespace icmd {
namespace config {

struct Settings
{
   // spidev node and bus parameters
   std::string spi_device = "/dev/spidev0.0";
   uint32_t spi_speed_hz = 10000000;
   uint8_t spi_mode = 0;

   // Written to the configuration registers at startup
   counter::CounterSetup counter;

   // Bytes per shadow register read transfer, 0 = whole register
   size_t read_chunk_bytes = 0;

   // Sampler poll period
   int sample_interval_ms = 10;

   // Treat nERR in a counter burst as a failed read
   bool fail_on_device_error = false;
};

// Parse a JSON document; missing keys keep their defaults.
// false (logged) on malformed JSON or invalid values.
bool settings_from_string(Settings* settings, const std::string& text);

// Read and parse a settings file; false (logged) if it cannot be read
bool settings_load_file(Settings* settings, const char* path);

// One-line summary for the startup log
std::string settings_describe(const Settings& settings);

} // namespace config
} // namespace icmd
