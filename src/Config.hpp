#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "FlirOneProtocol.hpp"

struct RunOptions {
    bool verbose = false;     // libusb debug logging
    bool full_dump = false;   // print whole payloads
    int frame_count = 1;
    unsigned int bulk_timeout_ms = FlirOneProtocol::BULK_TIMEOUT_MS;
    size_t config_buffer_size = FlirOneProtocol::CONFIG_READ_BUFFER_SIZE;
    size_t frame_buffer_size = FlirOneProtocol::FRAME_READ_BUFFER_SIZE;
};

constexpr size_t DUMP_PREVIEW_BYTES = 64;

#endif
