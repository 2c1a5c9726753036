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

#include "settings.h"

#include <cstdint>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <tinyformat.h>

#include "../util/log.h"

namespace icmd {
namespace counter {

NLOHMANN_JSON_SERIALIZE_ENUM( Direction, {
   {Direction::CW, "cw"},
   {Direction::CCW, "ccw"},
})

NLOHMANN_JSON_SERIALIZE_ENUM( ZSignal, {
   {ZSignal::NORMAL, "normal"},
   {ZSignal::INVERTED, "inverted"},
})

} // namespace counter

namespace config {

static bool settings_from_json(Settings* settings, const nlohmann::json& json)
{
   // Parsed wide and range-checked before narrowing so nothing wraps
   const int64_t speed_hz = json.value("spi_speed_hz", static_cast<int64_t>(settings->spi_speed_hz));
   const int mode = json.value("spi_mode", static_cast<int>(settings->spi_mode));
   const int64_t chunk_bytes = json.value("read_chunk_bytes", static_cast<int64_t>(settings->read_chunk_bytes));

   if (speed_hz <= 0 || speed_hz > UINT32_MAX)
   {
      LOG_ERROR("Settings: spi_speed_hz %d out of range 1..%u", speed_hz, UINT32_MAX);
      return false;
   }

   if (mode < 0 || mode > 3)
   {
      LOG_ERROR("Settings: spi_mode %d out of range 0..3", mode);
      return false;
   }

   if (chunk_bytes < 0)
   {
      LOG_ERROR("Settings: read_chunk_bytes must not be negative, got %d", chunk_bytes);
      return false;
   }

   settings->spi_device = json.value("spi_device", settings->spi_device);
   settings->spi_speed_hz = static_cast<uint32_t>(speed_hz);
   settings->spi_mode = static_cast<uint8_t>(mode);
   settings->read_chunk_bytes = static_cast<size_t>(chunk_bytes);
   settings->sample_interval_ms = json.value("sample_interval_ms", settings->sample_interval_ms);
   settings->fail_on_device_error = json.value("fail_on_device_error", settings->fail_on_device_error);
   settings->counter.ttl_inputs = json.value("ttl_inputs", settings->counter.ttl_inputs);
   settings->counter.spi_priority = json.value("spi_priority", settings->counter.spi_priority);

   if (settings->sample_interval_ms <= 0)
   {
      LOG_ERROR("Settings: sample_interval_ms must be positive, got %d", settings->sample_interval_ms);
      return false;
   }

   if (json.contains("counter_layout"))
   {
      const auto name = json["counter_layout"].get<std::string>();
      if (!counter::parse_layout(name.c_str(), &settings->counter.layout))
      {
         LOG_ERROR("Settings: unknown counter_layout \"%s\"", name);
         return false;
      }
   }

   if (json.contains("counters") && json["counters"].is_array())
   {
      const auto& counters = json["counters"];
      if (counters.size() > counter::MAX_CHANNELS)
      {
         LOG_ERROR("Settings: %u counters configured, the chip has %u", counters.size(), counter::MAX_CHANNELS);
         return false;
      }

      for (size_t i = 0; i < counters.size(); i++)
      {
         counter::CounterChannelSetup& ch = settings->counter.channels[i];
         ch.direction = counters[i].value("direction", ch.direction);
         ch.z_signal = counters[i].value("z_signal", ch.z_signal);
      }
   }

   return true;
}

bool settings_from_string(Settings* settings, const std::string& text)
{
   try
   {
      const auto json = nlohmann::json::parse(text);
      return settings_from_json(settings, json);
   }
   catch (const nlohmann::json::parse_error& e)
   {
      LOG_ERROR("Settings: JSON parse error: %s", e.what());
   }
   catch (const nlohmann::json::exception& e)
   {
      LOG_ERROR("Settings: JSON error: %s", e.what());
   }
   return false;
}

bool settings_load_file(Settings* settings, const char* path)
{
   std::ifstream f(path, std::ios::in);
   if (f.fail())
   {
      LOG_ERROR("Settings: cannot open %s", path);
      return false;
   }

   std::stringstream buffer;
   buffer << f.rdbuf();

   if (!settings_from_string(settings, buffer.str()))
   {
      return false;
   }

   LOG_INFO("Loaded settings from %s", path);
   return true;
}

std::string settings_describe(const Settings& settings)
{
   const counter::LayoutInfo* layout = counter::layout_info(settings.counter.layout);
   return tfm::format("%s @ %u Hz mode %d, layout %s, %s inputs, chunk %u, every %d ms",
                      settings.spi_device, settings.spi_speed_hz, settings.spi_mode,
                      layout ? layout->name : "?",
                      settings.counter.ttl_inputs ? "TTL" : "RS-422",
                      settings.read_chunk_bytes, settings.sample_interval_ms);
}

} // namespace config
} // namespace icmd
