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

// Background polling of the latched counter
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <pthread.h>

#include "device.h"
#include "../util/spsc_queue.h"

namespace icmd {
namespace core {

struct CounterSample {
    int64_t position = 0;       // Valid only if ok
    uint64_t timestamp_us = 0;  // CLOCK_MONOTONIC at the end of the read
    bool ok = false;
};

//
// Sampler - polls Device::read_counter() on its own thread
//
// Samples travel to the consumer through a lock-free SPSC queue; the
// consumer calls drain() from one thread only. When the consumer falls
// behind, new samples are dropped and counted rather than blocking the
// poll loop.
//
class Sampler {
public:
    static constexpr size_t QUEUE_CAPACITY = 1024;

    explicit Sampler(Device* device);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    // priority > 0 requests SCHED_FIFO at that priority (best effort)
    bool start(unsigned interval_us, int priority = 0);
    void stop();

    bool running() const { return running_.load(); }

    // Hand every queued sample to callback; returns the number drained
    template<typename F>
    size_t drain(F&& callback)
    {
        size_t n = 0;
        CounterSample sample;
        while (queue_.try_dequeue(sample)) {
            callback(sample);
            ++n;
        }
        return n;
    }

    uint64_t sample_count() const { return samples_.load(); }
    uint64_t failure_count() const { return failures_.load(); }
    uint64_t dropped_count() const { return dropped_.load(); }

private:
    static void* launch(void* arg);
    void run();

    Device* device_;
    SPSCQueue<CounterSample> queue_;

    pthread_t thread_{};
    bool started_ = false;
    std::atomic<bool> running_{false};
    unsigned interval_us_ = 0;

    std::atomic<uint64_t> samples_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace core
} // namespace icmd
