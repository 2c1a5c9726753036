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
#include <deque>
#include <vector>

#include "platform/transport.h"

namespace icmd {
namespace test {

//
// ScriptedTransport - replays canned replies and records every transfer
//
// Each transfer consumes the next scripted step. A reply step returns its
// bytes as they are, so a short reply simulates a truncated response.
// With the script exhausted, writes succeed and reads fail.
//
class ScriptedTransport : public platform::Transport {
public:
    struct Transfer {
        std::vector<uint8_t> command;
        size_t response_length;
    };

    void reply(std::vector<uint8_t> bytes) { script_.push_back(Step{false, std::move(bytes)}); }
    void ack() { reply({}); }
    void fault() { script_.push_back(Step{true, {}}); }

    protocol::Status transfer(const std::vector<uint8_t>& command,
                              size_t response_length,
                              std::vector<uint8_t>* response) override;

    const std::vector<Transfer>& transfers() const { return transfers_; }
    size_t transfer_count() const { return transfers_.size(); }
    size_t pending() const { return script_.size(); }

private:
    struct Step {
        bool fault;
        std::vector<uint8_t> bytes;
    };

    std::deque<Step> script_;
    std::vector<Transfer> transfers_;
};

} // namespace test
} // namespace icmd
