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

#include "device.h"

#include <tinyformat.h>

#include "../util/log.h"

namespace icmd {
namespace core {

using protocol::BusLock;
using protocol::Error;
using protocol::RegisterId;
using protocol::Result;
using protocol::Status;

Device::Device(platform::Transport* transport)
    : engine_(transport)
{
}

Status Device::init(const counter::CounterSetup& setup)
{
    const counter::LayoutInfo* layout = counter::layout_info(setup.layout);
    if (layout == nullptr) {
        Error err = protocol::protocol_violation(tfm::format("unknown counter layout %d",
                                                             static_cast<int>(setup.layout)));
        LOG_ERROR("init: %s", err.to_string());
        return err;
    }

    const uint8_t counter_cfg = counter::counter_config_byte(setup);
    const uint8_t interface_cfg = counter::interface_config_byte(setup);

    BusLock lock(engine_);

    Status st = engine_.write_register(RegisterId::COUNTER_CONFIG, counter_cfg);
    if (!st) {
        LOG_ERROR("init: counter config: %s", st.error().to_string());
        return st;
    }

    st = engine_.write_register(RegisterId::INTERFACE_CONFIG, interface_cfg);
    if (!st) {
        LOG_ERROR("init: interface config: %s", st.error().to_string());
        return st;
    }

    LOG_INFO("Counter layout %s, config 0x%02x, interface 0x%02x",
             layout->name, counter_cfg, interface_cfg);
    return Status::success();
}

Status Device::probe()
{
    Result<uint64_t> id = engine_.read_register(RegisterId::DEVICE_ID);
    if (!id) {
        return id.status();
    }

    if (id.value() != protocol::DEVICE_ID_VALUE) {
        Error err = protocol::decode_inconsistency(tfm::format("device id 0x%02x, expected 0x%02x",
                                                               id.value(), protocol::DEVICE_ID_VALUE));
        LOG_ERROR("probe: %s", err.to_string());
        return err;
    }

    LOG_INFO("Found iC-MD");
    return Status::success();
}

// Counter 0 wraps at its configured width; the touch probe registers hold
// it zero-extended to 48 bits
Result<unsigned> Device::counter0_bits()
{
    const counter::FieldInfo& layout_field = *counter::field_info(counter::ConfigField::COUNTER_LAYOUT);

    Result<uint64_t> cfg = engine_.read_register(layout_field.reg);
    if (!cfg) {
        return cfg.error();
    }

    const auto layout = static_cast<counter::CounterLayout>(counter::extract_field(cfg.value(), layout_field));
    return static_cast<unsigned>(counter::layout_info(layout)->bits[0]);
}

Result<int64_t> Device::read_counter()
{
    BusLock lock(engine_);

    Result<unsigned> bits = counter0_bits();
    if (!bits) {
        return bits.error();
    }

    Result<uint64_t> raw = engine_.read_counter_snapshot(actuator_bits_.load());
    if (!raw) {
        return raw.error();
    }
    return counter::sign_extend(raw.value(), bits.value());
}

Result<counter::CounterReading> Device::read_counters()
{
    const counter::FieldInfo& layout_field = *counter::field_info(counter::ConfigField::COUNTER_LAYOUT);
    std::vector<uint8_t> bytes;
    counter::CounterLayout layout;

    {
        // Nobody may reconfigure between reading the layout and the burst
        BusLock lock(engine_);

        Result<uint64_t> cfg = engine_.read_register(layout_field.reg);
        if (!cfg) {
            return cfg.error();
        }

        layout = static_cast<counter::CounterLayout>(counter::extract_field(cfg.value(), layout_field));
        const counter::LayoutInfo* info = counter::layout_info(layout);

        Status st = engine_.read_register_bytes(info->burst_register, &bytes);
        if (!st) {
            return st.error();
        }
    }

    Result<counter::CounterReading> reading = counter::decode_burst(layout, bytes);
    if (!reading) {
        LOG_WARN("read_counters: %s", reading.error().to_string());
        return reading;
    }

    last_status_ = bytes.back();

    const counter::DeviceStatus& status = reading.value().status;
    if (status.error && fail_on_device_error_) {
        Error err = protocol::decode_inconsistency("chip reports nERR with counter data");
        LOG_WARN("read_counters: %s", err.to_string());
        return err;
    }
    if (!status.ok()) {
        LOG_DEBUG("read_counters: status%s%s", status.error ? " error" : "", status.warning ? " warning" : "");
    }

    return reading;
}

Status Device::write_config(counter::ConfigField field, uint32_t value)
{
    const counter::FieldInfo* info = counter::field_info(field);
    if (info == nullptr) {
        Error err = protocol::protocol_violation(tfm::format("unknown config field %d", static_cast<int>(field)));
        LOG_WARN("write_config: %s", err.to_string());
        return err;
    }

    if (value > info->max_value()) {
        Error err = protocol::protocol_violation(tfm::format("%s: value %u out of range 0..%u",
                                                             info->name, value, info->max_value()));
        LOG_WARN("write_config: %s", err.to_string());
        return err;
    }

    BusLock lock(engine_);

    Result<uint64_t> current = engine_.read_register(info->reg);
    if (!current) {
        return current.error();
    }

    const uint64_t updated = counter::insert_field(current.value(), *info, value);
    if (updated == current.value()) {
        return Status::success();
    }

    LOG_DEBUG("%s = %u (%s 0x%02x -> 0x%02x)", info->name, value, protocol::register_name(info->reg),
              current.value(), updated);
    return engine_.write_register(info->reg, updated);
}

Result<uint32_t> Device::read_config(counter::ConfigField field)
{
    const counter::FieldInfo* info = counter::field_info(field);
    if (info == nullptr) {
        Error err = protocol::protocol_violation(tfm::format("unknown config field %d", static_cast<int>(field)));
        LOG_WARN("read_config: %s", err.to_string());
        return err;
    }

    Result<uint64_t> current = engine_.read_register(info->reg);
    if (!current) {
        return current.error();
    }
    return counter::extract_field(current.value(), *info);
}

Status Device::write_instruction(uint8_t bits)
{
    // Load the actuator levels under the lock set_actuator_pins() stores them under
    BusLock lock(engine_);

    return engine_.write_register(RegisterId::INSTRUCTION, bits | actuator_bits_.load());
}

Status Device::reset_counters(bool counter0, bool counter1, bool counter2)
{
    uint8_t bits = 0;
    if (counter0) bits |= protocol::INSTR_AB_RES0;
    if (counter1) bits |= protocol::INSTR_AB_RES1;
    if (counter2) bits |= protocol::INSTR_AB_RES2;

    if (bits == 0) {
        return Status::success();
    }

    Status st = write_instruction(bits);
    if (st) {
        LOG_INFO("Counters reset (mask 0x%x)", bits);
    }
    return st;
}

Status Device::set_actuator_pins(bool act0, bool act1)
{
    uint8_t bits = 0;
    if (act0) bits |= protocol::INSTR_ACT0;
    if (act1) bits |= protocol::INSTR_ACT1;

    BusLock lock(engine_);

    Status st = engine_.write_register(RegisterId::INSTRUCTION, bits);
    if (st) {
        actuator_bits_ = bits;
    }
    return st;
}

Status Device::touch_probe()
{
    return write_instruction(protocol::INSTR_TP);
}

Result<int64_t> Device::read_touch_probe(int index)
{
    if (index != 1 && index != 2) {
        Error err = protocol::protocol_violation(tfm::format("touch probe %d does not exist", index));
        LOG_WARN("read_touch_probe: %s", err.to_string());
        return err;
    }

    BusLock lock(engine_);

    Result<unsigned> bits = counter0_bits();
    if (!bits) {
        return bits.error();
    }

    Result<uint64_t> raw = engine_.read_register(index == 1 ? RegisterId::TOUCH_PROBE_1 : RegisterId::TOUCH_PROBE_2);
    if (!raw) {
        return raw.error();
    }
    return counter::sign_extend(raw.value(), bits.value());
}

Result<int64_t> Device::read_reference()
{
    const protocol::RegisterInfo* info = protocol::register_info(RegisterId::REFERENCE);

    Result<uint64_t> raw = engine_.read_register(RegisterId::REFERENCE);
    if (!raw) {
        return raw.error();
    }
    return counter::sign_extend(raw.value(), info->width * 8);
}

Result<counter::FullStatus> Device::read_full_status()
{
    uint8_t regs[3] = {};
    const RegisterId ids[3] = {RegisterId::STATUS_0, RegisterId::STATUS_1, RegisterId::STATUS_2};

    BusLock lock(engine_);

    for (size_t i = 0; i < 3; ++i) {
        Result<uint64_t> r = engine_.read_register(ids[i]);
        if (!r) {
            return r.error();
        }
        regs[i] = static_cast<uint8_t>(r.value());
    }

    return counter::decode_full_status(regs[0], regs[1], regs[2]);
}

counter::DeviceStatus Device::device_status() const
{
    return counter::decode_status_byte(last_status_.load());
}

} // namespace core
} // namespace icmd
