/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 */

#include "test_harness.h"

#include <tinyformat.h>

#include "counter/config_fields.h"
#include "counter/counter_value.h"
#include "counter/device_status.h"

namespace icmd {
namespace test {

using namespace counter;
using protocol::Result;

static TestResult test_decode_boundaries()
{
    TestResult result;
    result.name = "48-bit decode boundaries";

    check(result, decode(0) == 0, "0x000000000000 != 0");
    check(result, decode(0x7FFFFFFFFFFFULL) == 140737488355327LL, "0x7FFFFFFFFFFF != 140737488355327");
    check(result, decode(0x800000000000ULL) == -140737488355328LL, "0x800000000000 != -140737488355328");
    check(result, decode(0xFFFFFFFFFFFFULL) == -1, "0xFFFFFFFFFFFF != -1");
    check(result, decode(0x000000000001ULL) == 1, "0x000000000001 != 1");
    check(result, decode(0xFFFFFFFFFFFEULL) == -2, "0xFFFFFFFFFFFE != -2");

    // Bits above 47 must not leak into the value
    check(result, decode(0xABCD000000000005ULL) == 5, "bits above 47 changed the value");
    check(result, decode(0x0001FFFFFFFFFFFFULL) == -1, "bit 48 changed the value");

    return finish(result, "0, max, min, -1 and masked upper bits decode correctly");
}

static TestResult test_encode_round_trip()
{
    TestResult result;
    result.name = "48-bit encode/decode round trip";

    const int64_t values[] = {0, 1, -1, 42, -42, 123456789012LL, -123456789012LL, COUNTER_MAX, COUNTER_MIN};
    for (int64_t v : values) {
        const uint64_t raw = encode(v);
        check(result, raw <= 0xFFFFFFFFFFFFULL, tfm::format("encode(%d) wider than 48 bits", v));
        check(result, decode(raw) == v, tfm::format("decode(encode(%d)) = %d", v, decode(raw)));
    }

    check(result, encode(-1) == 0xFFFFFFFFFFFFULL, "encode(-1) != 0xFFFFFFFFFFFF");
    check(result, encode(COUNTER_MIN) == 0x800000000000ULL, "encode(min) != 0x800000000000");
    check(result, is_representable(COUNTER_MAX) && !is_representable(COUNTER_MAX + 1),
          "representable range upper edge wrong");
    check(result, is_representable(COUNTER_MIN) && !is_representable(COUNTER_MIN - 1),
          "representable range lower edge wrong");

    return finish(result, "Representable values survive encode then decode");
}

static TestResult test_sign_extend_widths()
{
    TestResult result;
    result.name = "Sign extension at 16, 24 and 32 bits";

    check(result, sign_extend(0x7FFF, 16) == 32767, "16-bit max");
    check(result, sign_extend(0x8000, 16) == -32768, "16-bit min");
    check(result, sign_extend(0xFFFF, 16) == -1, "16-bit -1");
    check(result, sign_extend(0x800000, 24) == -8388608, "24-bit min");
    check(result, sign_extend(0xFFFFFD, 24) == -3, "24-bit -3");
    check(result, sign_extend(0x7FFFFF, 24) == 8388607, "24-bit max");
    check(result, sign_extend(0x80000000ULL, 32) == -2147483648LL, "32-bit min");
    check(result, sign_extend(0x12FFFF, 16) == -1, "16-bit extension looked above bit 15");

    return finish(result, "Each width replicates its own top bit");
}

static TestResult test_burst_1x48()
{
    TestResult result;
    result.name = "Burst decode 1x48";

    Result<CounterReading> r = decode_burst(CounterLayout::LAYOUT_1x48,
                                            {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xC0});
    check(result, r.ok(), "decode failed");
    if (r) {
        check(result, r.value().channels == 1, "expected one channel");
        check(result, r.value().values[0] == -1, tfm::format("counter 0 = %d, expected -1", r.value().values[0]));
        check(result, r.value().status.ok(), "status byte 0xC0 should be ok");
        check(result, !r.value().channel(1).has_value(), "1x48 has no counter 1");
    }

    r = decode_burst(CounterLayout::LAYOUT_1x48, {0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xC0});
    check(result, r.ok() && r.value().values[0] == 256, "0x000000000100 != 256");

    return finish(result, "FF FF FF FF FF FF C0 = -1, status ok");
}

static TestResult test_burst_2x24()
{
    TestResult result;
    result.name = "Burst decode 2x24";

    Result<CounterReading> r = decode_burst(CounterLayout::LAYOUT_2x24,
                                            {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFD, 0xC0});
    check(result, r.ok(), "decode failed");
    if (r) {
        check(result, r.value().values[0] == -3, tfm::format("counter 0 = %d, expected -3", r.value().values[0]));
        check(result, r.value().values[1] == -1, tfm::format("counter 1 = %d, expected -1", r.value().values[1]));
    }

    return finish(result, "Counter 1 first on the wire, counter 0 = -3, counter 1 = -1");
}

static TestResult test_burst_small_layouts()
{
    TestResult result;
    result.name = "Burst decode 16/24/32-bit layouts";

    Result<CounterReading> r = decode_burst(CounterLayout::LAYOUT_2x16, {0x00, 0x2A, 0x00, 0x0D, 0xC0});
    check(result, r.ok() && r.value().values[0] == 13 && r.value().values[1] == 42, "2x16: expected 13 / 42");

    r = decode_burst(CounterLayout::LAYOUT_3x16, {0x80, 0x00, 0x7F, 0xFF, 0xFF, 0xFE, 0xC0});
    check(result, r.ok(), "3x16 decode failed");
    if (r) {
        check(result, r.value().values[0] == -2, "3x16 counter 0 != -2");
        check(result, r.value().values[1] == 32767, "3x16 counter 1 != 32767");
        check(result, r.value().values[2] == -32768, "3x16 counter 2 != -32768");
    }

    // 4 bytes of counter 1, then 2 bytes of counter 0
    r = decode_burst(CounterLayout::LAYOUT_32_16, {0xFF, 0xFF, 0xFF, 0xFE, 0x80, 0x01, 0xC0});
    check(result, r.ok(), "32+16 decode failed");
    if (r) {
        check(result, r.value().values[1] == -2, tfm::format("32+16 counter 1 = %d, expected -2", r.value().values[1]));
        check(result, r.value().values[0] == -32767, tfm::format("32+16 counter 0 = %d, expected -32767", r.value().values[0]));
    }
    r = decode_burst(CounterLayout::LAYOUT_32_16, {0x00, 0x01, 0x00, 0x00, 0x7F, 0xFF, 0xC0});
    check(result, r.ok() && r.value().values[1] == 65536 && r.value().values[0] == 32767,
          "32+16: 65536 must come from the first four bytes");

    r = decode_burst(CounterLayout::LAYOUT_1x24, {0x80, 0x00, 0x00, 0xC0});
    check(result, r.ok() && r.value().values[0] == -8388608, "1x24: expected -8388608");

    r = decode_burst(CounterLayout::LAYOUT_1x16, {0xFF, 0xF6, 0xC0});
    check(result, r.ok() && r.value().values[0] == -10, "1x16: expected -10");

    r = decode_burst(CounterLayout::LAYOUT_1x32, {0xFF, 0xFF, 0xFF, 0xFF, 0xC0});
    check(result, r.ok() && r.value().values[0] == -1, "1x32: expected -1");

    return finish(result, "Every layout sign-extends each counter from its own width");
}

static TestResult test_burst_status_and_length()
{
    TestResult result;
    result.name = "Burst status byte and length check";

    Result<CounterReading> r = decode_burst(CounterLayout::LAYOUT_2x16, {0x00, 0x2A, 0x00, 0x0D, 0x40});
    check(result, r.ok(), "status 0x40 should still decode");
    if (r) {
        check(result, r.value().status.error, "0x40 has nERR low: error expected");
        check(result, !r.value().status.warning, "0x40 has nWARN high: no warning expected");
        check(result, !r.value().status.ok(), "0x40 must not be ok");
    }

    r = decode_burst(CounterLayout::LAYOUT_1x16, {0x00, 0x01, 0x80});
    check(result, r.ok() && r.value().status.warning && !r.value().status.error, "0x80 should be warning only");

    r = decode_burst(CounterLayout::LAYOUT_1x48, {0x00, 0x00, 0x00, 0x01, 0xC0});
    check(result, !r.ok() && r.error().kind == protocol::ErrorKind::PROTOCOL_VIOLATION,
          "short 1x48 burst must be a protocol violation");

    r = decode_burst(static_cast<CounterLayout>(9), {0xC0});
    check(result, !r.ok(), "layout code 9 must be rejected");

    return finish(result, "nERR/nWARN decoded active low, wrong lengths rejected");
}

static TestResult test_layout_table()
{
    TestResult result;
    result.name = "Layout table matches the register map";

    for (uint8_t code = 0; code < 8; ++code) {
        const LayoutInfo* info = layout_info(static_cast<CounterLayout>(code));
        check(result, info != nullptr, tfm::format("layout %d missing", code));
        if (info == nullptr) continue;

        size_t bytes = 1;
        for (uint8_t ch = 0; ch < info->channels; ++ch) bytes += info->bits[ch] / 8;

        const protocol::RegisterInfo* reg = protocol::register_info(info->burst_register);
        check(result, reg != nullptr && reg->width == bytes,
              tfm::format("%s: burst width %d, register width %d", info->name, bytes, reg ? reg->width : 0));
        check(result, reg != nullptr && reg->address == 0x08, tfm::format("%s: not at 0x08", info->name));

        CounterLayout parsed;
        check(result, parse_layout(info->name, &parsed) && parsed == info->layout,
              tfm::format("%s does not parse back", info->name));
    }

    CounterLayout parsed;
    check(result, !parse_layout("4x12", &parsed), "4x12 should not parse");
    check(result, layout_info(static_cast<CounterLayout>(8)) == nullptr, "layout 8 should not exist");

    return finish(result, "8 layouts, widths agree with the counter register views");
}

static TestResult test_full_status()
{
    TestResult result;
    result.name = "Full status decode";

    FullStatus s = decode_full_status(0x8C, 0x00, 0x00);
    check(result, s.ab_error[0], "0x8C: AB error on counter 0 expected");
    check(result, s.reference_valid, "0x8C: reference valid expected");
    check(result, s.upd_valid, "0x8C: UPD valid expected");
    check(result, !s.overflow[0] && !s.zero[0] && !s.power_down && !s.touch_probe_updated,
          "0x8C: unexpected extra flags");
    check(result, !s.ab_error[1] && !s.ab_error[2], "0x8C: no AB error on counters 1, 2");
    check(result, !s.ok(), "AB error must not be ok");
    check(result, s.describe() == "ab error 0", "describe: " + s.describe());

    s = decode_full_status(0x00, 0x49, 0x0D);
    check(result, s.overflow[1] && s.tpi_high && s.ext_error, "status 1 flags");
    check(result, s.ssi_enabled && s.ext_warning, "status 2 flags");

    s = decode_full_status(0x28, 0x00, 0x00);
    check(result, s.ok(), "zero and reference valid are informational");

    return finish(result, "0x8C = AB error on counter 0, valid bits informational");
}

static TestResult test_config_bytes()
{
    TestResult result;
    result.name = "Configuration register encoding";

    CounterSetup setup;
    check(result, counter_config_byte(setup) == 0x02, tfm::format("default = 0x%02x, expected 0x02",
                                                                  counter_config_byte(setup)));
    check(result, interface_config_byte(setup) == 0x00, "default interface != 0x00");

    setup.layout = CounterLayout::LAYOUT_2x16;
    setup.channels[0].direction = Direction::CCW;
    setup.channels[0].z_signal = ZSignal::INVERTED;
    check(result, counter_config_byte(setup) == 0x4E, tfm::format("2x16 CCW inverted = 0x%02x, expected 0x4E",
                                                                  counter_config_byte(setup)));

    setup.ttl_inputs = true;
    setup.spi_priority = true;
    check(result, interface_config_byte(setup) == 0x81, "TTL + priority != 0x81");

    const FieldInfo* dir1 = field_info(ConfigField::DIRECTION_1);
    check(result, dir1 != nullptr && dir1->max_value() == 1, "direction_1 max != 1");
    if (dir1) {
        check(result, insert_field(0x4E, *dir1, 1) == 0x5E, "direction_1 insert");
        check(result, extract_field(0x5E, *dir1) == 1, "direction_1 extract");
    }

    ConfigField f;
    check(result, parse_field("ttl_inputs", &f) && f == ConfigField::TTL_INPUTS, "ttl_inputs name");
    check(result, !parse_field("filter", &f), "unknown field parsed");
    check(result, field_info(ConfigField::COUNTER_LAYOUT)->max_value() == 7, "layout max != 7");

    return finish(result, "Default 0x02, 2x16 CCW inverted Z 0x4E");
}

std::vector<TestResult> counter_value_tests()
{
    return {
        test_decode_boundaries(),
        test_encode_round_trip(),
        test_sign_extend_widths(),
        test_burst_1x48(),
        test_burst_2x24(),
        test_burst_small_layouts(),
        test_burst_status_and_length(),
        test_layout_table(),
        test_full_status(),
        test_config_bytes(),
    };
}

} // namespace test
} // namespace icmd
