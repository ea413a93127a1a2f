#include "Capture.hpp"
#include "LibusbAdapter.hpp"
#include "Options.hpp"
#include <getopt.h>
#include <algorithm>
#include <climits>
#include <iostream>
#include <string>

#define ARGUMENTS                                                                              \
    _VAL('v', "verbose", no_argument, "", "enable libusb debug logging")                       \
    _VAL('n', "frames", required_argument, "count", "number of frame payloads to read")        \
    _VAL('t', "timeout", required_argument, "ms", "bulk transfer timeout in milliseconds")     \
    _VAL('x', "full-dump", no_argument, "", "print whole payloads instead of the first bytes") \
    _VAL('h', "help", no_argument, "", "help message")

static const char *shortopts = "vn:t:xh";
#define _VAL(sarg, larg, haspara, ind, desc) \
    option{larg, haspara, 0, sarg},
static const struct option longopts[] = {
    ARGUMENTS
    option{nullptr, 0, nullptr, 0}};
#undef _VAL

#define _VAL(sarg, larg, haspara, ind, desc)          \
    do {                                              \
        std::string line("  -");                      \
        line += sarg;                                 \
        line += ",--";                                \
        line += larg;                                 \
        line += "  ";                                 \
        if (haspara == required_argument) {           \
            line += ind;                              \
        }                                             \
        if (line.length() < 30)                       \
            line += std::string(30 - line.length(), ' '); \
        std::cerr << line << desc << std::endl;       \
    } while (0);

static void usage(const char *prog) {
    std::cerr << prog << " [options]" << std::endl;
    ARGUMENTS
}
#undef _VAL

int main(int argc, char *argv[]) {
    RunOptions options;
    int opt;
    int longidx = 0;
    long value = 0;

    while ((opt = getopt_long(argc, argv, shortopts, longopts, &longidx)) > 0) {
        switch (opt) {
            case 'v':
                options.verbose = true;
                break;

            case 'n':
                if (!parse_positive(optarg, INT_MAX, value)) {
                    std::cerr << "invalid frame count: " << optarg << std::endl;
                    return 2;
                }
                options.frame_count = static_cast<int>(value);
                break;

            case 't':
                if (!parse_positive(optarg, static_cast<long>(std::min<unsigned long>(UINT_MAX, LONG_MAX)), value)) {
                    std::cerr << "invalid timeout: " << optarg << std::endl;
                    return 2;
                }
                options.bulk_timeout_ms = static_cast<unsigned int>(value);
                break;

            case 'x':
                options.full_dump = true;
                break;

            case 'h':
                usage(argv[0]);
                return 0;

            default:
                usage(argv[0]);
                return 2;
        }
    }

    return run_capture(std::make_unique<LibusbAdapter>(options.verbose), options);
}
