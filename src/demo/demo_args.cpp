// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "demo_args.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace ringview {

namespace {

bool parse_int(const char* str, int& out, const char* name) {
    char* end = nullptr;
    errno = 0;
    long val = strtol(str, &end, 10);
    if (errno != 0 || end == str || *end != '\0' || val < 0 || val > 1000000) {
        printf("Error: Invalid %s value: %s\n", name, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// "WxH", both > 0
bool parse_size(const char* str, int& width, int& height) {
    const char* x = strchr(str, 'x');
    if (!x) {
        printf("Error: --size expects WxH, got: %s\n", str);
        return false;
    }
    std::string w(str, x);
    if (!parse_int(w.c_str(), width, "--size width") || !parse_int(x + 1, height, "--size height"))
        return false;
    if (width == 0 || height == 0) {
        printf("Error: --size must be non-zero: %s\n", str);
        return false;
    }
    return true;
}

} // namespace

bool parse_demo_args(int argc, const char* const* argv, DemoArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
        } else if (strcmp(arg, "--style") == 0) {
            if (!has_value) {
                printf("Error: --style requires a file path\n");
                return false;
            }
            args.style_path = argv[++i];
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--size") == 0) {
            if (!has_value) {
                printf("Error: -s/--size requires an argument\n");
                return false;
            }
            if (!parse_size(argv[++i], args.width, args.height))
                return false;
        } else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--duration") == 0) {
            if (!has_value) {
                printf("Error: -d/--duration requires milliseconds\n");
                return false;
            }
            if (!parse_int(argv[++i], args.duration_ms, "--duration"))
                return false;
        } else if (strcmp(arg, "--spin") == 0) {
            if (!has_value) {
                printf("Error: --spin requires milliseconds\n");
                return false;
            }
            if (!parse_int(argv[++i], args.spin_ms, "--spin"))
                return false;
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (!has_value) {
                printf("Error: --log-dest requires auto|syslog|file|console\n");
                return false;
            }
            args.log_target = logging::parse_log_target(argv[++i]);
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!has_value) {
                printf("Error: --log-file requires a path\n");
                return false;
            }
            args.log_file = argv[++i];
            args.log_target = logging::LogTarget::File;
        } else if (arg[0] == '-' && arg[1] == 'v') {
            // -v, -vv, -vvv
            const char* p = arg + 1;
            while (*p == 'v')
                p++;
            if (*p != '\0') {
                printf("Error: Unknown option: %s\n", arg);
                return false;
            }
            args.verbosity += static_cast<int>(p - (arg + 1));
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else {
            printf("Error: Unknown option: %s\n", arg);
            return false;
        }
    }
    return true;
}

void print_demo_usage(const char* program) {
    printf("Usage: %s [options]\n", program);
    printf("  --style <file>        Progress style JSON\n");
    printf("  -s, --size <WxH>      Widget size (default 240x240)\n");
    printf("  -d, --duration <ms>   Run time (default 6000)\n");
    printf("  --spin <ms>           Spin before the first value (default 1500)\n");
    printf("  --log-dest <target>   auto|syslog|file|console\n");
    printf("  --log-file <path>     Log to a rotating file\n");
    printf("  -v, -vv, -vvv         Verbosity (info, debug, trace)\n");
    printf("  -h, --help            Show this help\n");
}

} // namespace ringview
