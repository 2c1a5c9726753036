/*
 * Copyright (C) 2018 Mark Hills <mark@xwax.org>
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

// icmd-monitor: print the iC-MD position counter

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <getopt.h>
#include <unistd.h>

#include "core/device.h"
#include "core/sampler.h"
#include "core/settings.h"
#include "platform/transport.h"

#include "util/log.h"

using namespace icmd;

struct Options {
    const char* config_path = nullptr;
    const char* device = nullptr;
    long speed_hz = -1;
    int interval_ms = -1;
    long count = 0;             // 0 = until SIGINT
    bool reset = false;
    bool status = false;
    bool burst = false;
};

static volatile sig_atomic_t g_quit = 0;

static void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s [OPTIONS]\n\n", program);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  --config PATH          JSON settings file\n");
    fprintf(stderr, "  --device PATH          spidev node (default: /dev/spidev0.0)\n");
    fprintf(stderr, "  --speed HZ             SPI clock (default: 10000000)\n");
    fprintf(stderr, "  --interval-ms MS       Sample period (default: 10)\n");
    fprintf(stderr, "  --count N              Stop after N samples (default: run until Ctrl-C)\n");
    fprintf(stderr, "  --reset                Reset all counters before sampling\n");
    fprintf(stderr, "  --status               Print the full device status and exit\n");
    fprintf(stderr, "  --burst                Print all counters of the configured layout\n");
    fprintf(stderr, "  --log-file-path PATH   Log to specified file path\n");
    fprintf(stderr, "  --log-level LEVEL      Set log level (debug, info, warn, error)\n");
    fprintf(stderr, "  --help                 Show this help message\n");
}

static log::Level parse_log_level(const char* str) {
    log::Level level;
    if (log::parse_level(str, &level)) {
        return level;
    }
    fprintf(stderr, "Unknown log level '%s', using 'info'\n", str);
    return log::Level::LVL_INFO;
}

static long parse_number(const char* program, const char* option, const char* str) {
    char* end = nullptr;
    long v = strtol(str, &end, 10);
    if (end == str || *end != '\0' || v < 0) {
        fprintf(stderr, "Invalid value '%s' for --%s\n", str, option);
        print_usage(program);
        exit(1);
    }
    return v;
}

static void parse_args(int argc, char* argv[], Options* opts, log::Config* log_config) {
    static struct option long_options[] = {
        {"config",         required_argument, nullptr, 'c'},
        {"device",         required_argument, nullptr, 'd'},
        {"speed",          required_argument, nullptr, 's'},
        {"interval-ms",    required_argument, nullptr, 'i'},
        {"count",          required_argument, nullptr, 'n'},
        {"reset",          no_argument,       nullptr, 'r'},
        {"status",         no_argument,       nullptr, 'S'},
        {"burst",          no_argument,       nullptr, 'b'},
        {"log-file-path",  required_argument, nullptr, 'p'},
        {"log-level",      required_argument, nullptr, 'l'},
        {"help",           no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:d:s:i:n:rSbp:l:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                opts->config_path = optarg;
                break;
            case 'd':
                opts->device = optarg;
                break;
            case 's':
                opts->speed_hz = parse_number(argv[0], "speed", optarg);
                break;
            case 'i':
                opts->interval_ms = static_cast<int>(parse_number(argv[0], "interval-ms", optarg));
                break;
            case 'n':
                opts->count = parse_number(argv[0], "count", optarg);
                break;
            case 'r':
                opts->reset = true;
                break;
            case 'S':
                opts->status = true;
                break;
            case 'b':
                opts->burst = true;
                break;
            case 'p':
                log_config->use_file = true;
                log_config->file_path = optarg;
                break;
            case 'l':
                log_config->min_level = parse_log_level(optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                exit(0);
            default:
                print_usage(argv[0]);
                exit(1);
        }
    }
}

static void sig_handler(int signo)
{
    if (signo == SIGINT) {
        g_quit = 1;
    }
}

static int print_status(core::Device& device)
{
    protocol::Result<counter::FullStatus> status = device.read_full_status();
    if (!status) {
        fprintf(stderr, "Status read failed: %s\n", status.error().to_string().c_str());
        return EXIT_FAILURE;
    }

    const counter::FullStatus& s = status.value();
    printf("status:            %s\n", s.describe().c_str());
    for (size_t i = 0; i < counter::MAX_CHANNELS; i++) {
        printf("counter %zu:         %s%s%s\n", i,
               s.overflow[i] ? "overflow " : "",
               s.ab_error[i] ? "ab-error " : "",
               s.zero[i] ? "zero" : "");
    }
    printf("reference valid:   %s\n", s.reference_valid ? "yes" : "no");
    printf("touch probe:       %s\n", s.touch_probe_updated ? "updated" : "-");
    printf("tpi pin:           %s\n", s.tpi_high ? "high" : "low");
    printf("ssi:               %s\n", s.ssi_enabled ? "enabled" : "disabled");

    protocol::Result<int64_t> ref = device.read_reference();
    if (ref) {
        printf("reference:         %lld\n", static_cast<long long>(ref.value()));
    }

    return s.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int run_burst(core::Device& device, const Options& opts, int interval_ms)
{
    long n = 0;
    while (!g_quit && (opts.count == 0 || n < opts.count)) {
        protocol::Result<counter::CounterReading> reading = device.read_counters();
        if (reading) {
            const counter::CounterReading& r = reading.value();
            printf("%s", counter::layout_info(r.layout)->name);
            for (uint8_t ch = 0; ch < r.channels; ch++) {
                printf(" %lld", static_cast<long long>(r.values[ch]));
            }
            printf("%s%s\n", r.status.error ? " ERR" : "", r.status.warning ? " WARN" : "");
        }
        fflush(stdout);

        log::flush_rt_logs();
        n++;
        usleep(static_cast<useconds_t>(interval_ms) * 1000);
    }
    return EXIT_SUCCESS;
}

static int run_sampler(core::Device& device, const Options& opts, int interval_ms)
{
    core::Sampler sampler(&device);
    if (!sampler.start(static_cast<unsigned>(interval_ms) * 1000)) {
        return EXIT_FAILURE;
    }

    long printed = 0;
    auto print = [&printed](const core::CounterSample& s) {
        if (s.ok) {
            printf("%llu.%06llu %lld\n",
                   static_cast<unsigned long long>(s.timestamp_us / 1000000),
                   static_cast<unsigned long long>(s.timestamp_us % 1000000),
                   static_cast<long long>(s.position));
        } else {
            printf("%llu.%06llu read failed\n",
                   static_cast<unsigned long long>(s.timestamp_us / 1000000),
                   static_cast<unsigned long long>(s.timestamp_us % 1000000));
        }
        printed++;
    };

    while (!g_quit && (opts.count == 0 || printed < opts.count)) {
        usleep(static_cast<useconds_t>(interval_ms) * 1000);
        sampler.drain(print);
        fflush(stdout);
        log::flush_rt_logs();
    }

    sampler.stop();
    log::flush_rt_logs();

    return sampler.failure_count() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    Options opts;
    log::Config log_config;
    parse_args(argc, argv, &opts, &log_config);

    log::init(log_config);

    config::Settings settings;
    if (opts.config_path != nullptr && !config::settings_load_file(&settings, opts.config_path)) {
        log::shutdown();
        return EXIT_FAILURE;
    }

    if (opts.device != nullptr) settings.spi_device = opts.device;
    if (opts.speed_hz >= 0) settings.spi_speed_hz = static_cast<uint32_t>(opts.speed_hz);
    if (opts.interval_ms > 0) settings.sample_interval_ms = opts.interval_ms;

    LOG_INFO("%s", config::settings_describe(settings));

    if (signal(SIGINT, sig_handler) == SIG_ERR) {
        LOG_ERROR("Can't catch SIGINT");
        log::shutdown();
        return EXIT_FAILURE;
    }

    platform::SpiConfig spi;
    spi.device = settings.spi_device.c_str();
    spi.speed_hz = settings.spi_speed_hz;
    spi.mode = settings.spi_mode;

    platform::SpidevTransport transport;
    if (!transport.open(spi)) {
        log::shutdown();
        return EXIT_FAILURE;
    }

    core::Device device(&transport);
    device.set_read_chunk_bytes(settings.read_chunk_bytes);
    device.set_fail_on_device_error(settings.fail_on_device_error);

    int rc = EXIT_FAILURE;

    if (!device.probe()) {
        goto out;
    }

    if (opts.status) {
        rc = print_status(device);
        goto out;
    }

    if (!device.init(settings.counter)) {
        goto out;
    }

    if (opts.reset && !device.reset_all_counters()) {
        goto out;
    }

    if (opts.burst) {
        rc = run_burst(device, opts, settings.sample_interval_ms);
    } else {
        rc = run_sampler(device, opts, settings.sample_interval_ms);
    }

    LOG_INFO("Exiting (%u bus transfers)", device.engine().transfer_count());

out:
    transport.close();
    log::shutdown();

    return rc;
}
