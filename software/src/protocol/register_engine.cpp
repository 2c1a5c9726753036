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

#include "register_engine.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

#include "../util/log.h"

namespace icmd {
namespace protocol {

static std::string hex_bytes(const std::vector<uint8_t>& bytes)
{
    std::string s;
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", bytes[i]);
        s += buf;
    }
    return s;
}

RegisterEngine::RegisterEngine(platform::Transport* transport)
    : transport_(transport)
{
    mutex_init_recursive(&bus_);
    scratch_.reserve(MAX_REGISTER_WIDTH);
}

RegisterEngine::~RegisterEngine()
{
    mutex_clear(&bus_);
}

Status RegisterEngine::transact(const CommandFrame& frame, RegisterId id, std::vector<uint8_t>* response)
{
    ++transfer_count_;

    Status st = transport_->transfer(frame.bytes, frame.response_length, response);
    if (!st) {
        LOG_WARN("%s: %s", register_name(id), st.error().to_string());
        return st;
    }

    // Never zero-pad: a short count would silently corrupt the sign
    if (response->size() != frame.response_length) {
        Error err = protocol_violation(tfm::format("%s: expected %u response bytes, got %u",
                                                   register_name(id), frame.response_length,
                                                   response->size()));
        LOG_WARN("%s", err.to_string());
        response->clear();
        return err;
    }

    LOG_DEBUG("%s: tx [%s] rx [%s]", register_name(id), hex_bytes(frame.bytes), hex_bytes(*response));
    return Status::success();
}

Status RegisterEngine::write_register(RegisterId id, uint64_t value)
{
    Result<CommandFrame> frame = build_write_frame(id, value);
    if (!frame) {
        LOG_WARN("Rejected write: %s", frame.error().to_string());
        return frame.error();
    }

    MutexGuard guard(&bus_);
    return transact(frame.value(), id, &scratch_);
}

Status RegisterEngine::read_register_bytes(RegisterId id, std::vector<uint8_t>* bytes)
{
    Result<CommandFrame> frame = build_read_frame(id);
    if (!frame) {
        LOG_WARN("Rejected read: %s", frame.error().to_string());
        return frame.error();
    }

    MutexGuard guard(&bus_);
    return transact(frame.value(), id, bytes);
}

Result<uint64_t> RegisterEngine::read_register(RegisterId id)
{
    std::vector<uint8_t> bytes;
    Status st = read_register_bytes(id, &bytes);
    if (!st) {
        return st.error();
    }
    return decode_be(bytes.data(), bytes.size());
}

Result<uint64_t> RegisterEngine::read_counter_snapshot(uint8_t persistent_bits)
{
    if ((persistent_bits & ~(INSTR_ACT0 | INSTR_ACT1)) != 0) {
        Error err = protocol_violation(tfm::format("latch may only carry actuator bits, got 0x%02x",
                                                   persistent_bits));
        LOG_WARN("Rejected latch: %s", err.to_string());
        return err;
    }

    Result<CommandFrame> latch = build_write_frame(RegisterId::INSTRUCTION, INSTR_TP | persistent_bits);
    if (!latch) {
        return latch.error();
    }

    const RegisterInfo* shadow = register_info(LATCH_SHADOW);
    const size_t width = shadow->width;
    const size_t chunk = chunk_bytes_ == 0 ? width : std::min(chunk_bytes_, width);

    // Build every read frame up front so nothing can be rejected after the latch
    std::vector<CommandFrame> reads;
    for (size_t offset = 0; offset < width; offset += chunk) {
        Result<CommandFrame> frame = build_read_chunk_frame(LATCH_SHADOW, offset,
                                                            std::min(chunk, width - offset));
        if (!frame) {
            LOG_WARN("Rejected snapshot read: %s", frame.error().to_string());
            return frame.error();
        }
        reads.push_back(frame.value());
    }

    MutexGuard guard(&bus_);

    Status st = transact(latch.value(), RegisterId::INSTRUCTION, &scratch_);
    if (!st) {
        return st.error();
    }

    // Assembled locally; discarded on any failure
    uint8_t raw[MAX_REGISTER_WIDTH] = {};
    size_t filled = 0;

    for (const CommandFrame& frame : reads) {
        st = transact(frame, LATCH_SHADOW, &scratch_);
        if (!st) {
            return st.error();
        }
        memcpy(raw + filled, scratch_.data(), scratch_.size());
        filled += scratch_.size();
    }

    return decode_be(raw, filled);
}

} // namespace protocol
} // namespace icmd
