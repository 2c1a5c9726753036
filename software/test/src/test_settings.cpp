/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 */

#include "test_harness.h"

#include "core/settings.h"

namespace icmd {
namespace test {

using config::Settings;
using counter::CounterLayout;
using counter::Direction;
using counter::ZSignal;

static TestResult test_settings_defaults()
{
    TestResult result;
    result.name = "Settings: empty document keeps defaults";

    Settings s;
    check(result, config::settings_from_string(&s, "{}"), "empty object rejected");
    check(result, s.spi_device == "/dev/spidev0.0", "spi_device default");
    check(result, s.spi_speed_hz == 10000000, "spi_speed_hz default");
    check(result, s.spi_mode == 0, "spi_mode default");
    check(result, s.counter.layout == CounterLayout::LAYOUT_1x48, "layout default");
    check(result, s.read_chunk_bytes == 0, "read_chunk_bytes default");
    check(result, s.sample_interval_ms == 10, "sample_interval_ms default");
    check(result, !s.fail_on_device_error, "fail_on_device_error default");
    check(result, counter::counter_config_byte(s.counter) == 0x02, "default setup != 0x02");

    return finish(result, "spidev0.0, 10 MHz, 1x48, 10 ms");
}

static TestResult test_settings_full()
{
    TestResult result;
    result.name = "Settings: every key parsed";

    const char* text = R"({
        "spi_device": "/dev/spidev1.0",
        "spi_speed_hz": 2000000,
        "spi_mode": 0,
        "counter_layout": "2x16",
        "counters": [
            {"direction": "ccw", "z_signal": "inverted"},
            {"direction": "cw"}
        ],
        "ttl_inputs": true,
        "spi_priority": false,
        "read_chunk_bytes": 2,
        "sample_interval_ms": 5,
        "fail_on_device_error": true
    })";

    Settings s;
    check(result, config::settings_from_string(&s, text), "document rejected");
    check(result, s.spi_device == "/dev/spidev1.0", "spi_device");
    check(result, s.spi_speed_hz == 2000000, "spi_speed_hz");
    check(result, s.counter.layout == CounterLayout::LAYOUT_2x16, "counter_layout");
    check(result, s.counter.channels[0].direction == Direction::CCW, "counter 0 direction");
    check(result, s.counter.channels[0].z_signal == ZSignal::INVERTED, "counter 0 z_signal");
    check(result, s.counter.channels[1].direction == Direction::CW, "counter 1 direction");
    check(result, s.counter.channels[1].z_signal == ZSignal::NORMAL, "counter 1 z_signal default");
    check(result, s.counter.ttl_inputs && !s.counter.spi_priority, "interface flags");
    check(result, s.read_chunk_bytes == 2, "read_chunk_bytes");
    check(result, s.sample_interval_ms == 5, "sample_interval_ms");
    check(result, s.fail_on_device_error, "fail_on_device_error");
    check(result, counter::counter_config_byte(s.counter) == 0x4E, "setup does not encode to 0x4E");

    return finish(result, "2x16, counter 0 CCW inverted -> 0x4E");
}

static TestResult test_settings_invalid()
{
    TestResult result;
    result.name = "Settings: invalid documents rejected";

    Settings s;
    check(result, !config::settings_from_string(&s, R"({"counter_layout": "4x12"})"), "unknown layout accepted");
    check(result, !config::settings_from_string(&s, R"({"spi_mode": 4})"), "spi_mode 4 accepted");
    check(result, !config::settings_from_string(&s, R"({"spi_mode": 256})"), "spi_mode 256 wrapped to 0");
    check(result, !config::settings_from_string(&s, R"({"spi_mode": -1})"), "spi_mode -1 accepted");
    check(result, !config::settings_from_string(&s, R"({"spi_speed_hz": -1})"), "negative speed wrapped");
    check(result, !config::settings_from_string(&s, R"({"spi_speed_hz": 4294967296})"), "speed above 32 bits wrapped");
    check(result, !config::settings_from_string(&s, R"({"read_chunk_bytes": -2})"), "negative chunk size wrapped");
    check(result, s.spi_mode == 0 && s.spi_speed_hz == 10000000 && s.read_chunk_bytes == 0,
          "rejected values leaked into the settings");
    check(result, !config::settings_from_string(&s, R"({"sample_interval_ms": 0})"), "zero interval accepted");
    check(result, !config::settings_from_string(&s, R"({"spi_speed_hz": "fast"})"), "string speed accepted");
    check(result, !config::settings_from_string(&s, R"({"counters": [{}, {}, {}, {}]})"), "4 counters accepted");
    check(result, !config::settings_from_string(&s, "{ not json"), "malformed JSON accepted");

    check(result, !config::settings_load_file(&s, "/nonexistent/icmd.json"), "missing file accepted");

    return finish(result, "Bad names, ranges, types and syntax return false");
}

std::vector<TestResult> settings_tests()
{
    return {
        test_settings_defaults(),
        test_settings_full(),
        test_settings_invalid(),
    };
}

} // namespace test
} // namespace icmd
