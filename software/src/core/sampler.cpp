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

#include "sampler.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sched.h>
#include <time.h>
#include <unistd.h>

#include "../util/log.h"

namespace icmd {
namespace core {

static uint64_t monotonic_us()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000;
}

Sampler::Sampler(Device* device)
    : device_(device),
      queue_(QUEUE_CAPACITY)
{
}

Sampler::~Sampler()
{
    stop();
}

bool Sampler::start(unsigned interval_us, int priority)
{
    if (started_) {
        LOG_WARN("Sampler already running");
        return false;
    }

    interval_us_ = interval_us;
    running_ = true;

    int r = pthread_create(&thread_, nullptr, launch, this);
    if (r != 0) {
        running_ = false;
        LOG_ERROR("Error - pthread_create() return code: %d", r);
        return false;
    }
    started_ = true;

    if (priority > 0) {
        struct sched_param sp;
        memset(&sp, 0, sizeof(sp));
        sp.sched_priority = priority;

        r = pthread_setschedparam(thread_, SCHED_FIFO, &sp);
        if (r != 0) {
            LOG_WARN("Sampler: SCHED_FIFO priority %d not applied: %s", priority, strerror(r));
        }
    }

    LOG_INFO("Sampler started, interval %u us", interval_us);
    return true;
}

void Sampler::stop()
{
    if (!started_) {
        return;
    }

    running_ = false;
    if (pthread_join(thread_, nullptr) != 0) {
        abort();
    }
    started_ = false;

    LOG_INFO("Sampler stopped: %u samples, %u failed, %u dropped",
             samples_.load(), failures_.load(), dropped_.load());
}

void* Sampler::launch(void* arg)
{
    static_cast<Sampler*>(arg)->run();
    return nullptr;
}

void Sampler::run()
{
    bool failing = false;

    while (running_) {
        protocol::Result<int64_t> position = device_->read_counter();

        CounterSample sample;
        sample.timestamp_us = monotonic_us();
        sample.ok = position.ok();

        if (position) {
            sample.position = position.value();
            if (failing) {
                LOG_RT_INFO("Sampler: counter readable again");
                failing = false;
            }
        } else {
            ++failures_;
            if (!failing) {
                LOG_RT_WARN("Sampler: %s", position.error().to_string());
                failing = true;
            }
        }

        ++samples_;
        if (!queue_.try_enqueue(sample)) {
            ++dropped_;
        }

        usleep(interval_us_);
    }
}

} // namespace core
} // namespace icmd
