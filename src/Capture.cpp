#include "Capture.hpp"
#include "FlirOne.hpp"
#include "Log.hpp"
#include <algorithm>
#include <exception>
#include <vector>

static void dump_payload(const char *label, const std::vector<uint8_t> &data, bool full) {
    dprintf("%s: %zu bytes\n", label, data.size());
    size_t shown = full ? data.size() : std::min(data.size(), DUMP_PREVIEW_BYTES);
    for (size_t i = 0; i < shown; i++) {
        dprintf("%02X%s", data[i], (i % 16 == 15 || i + 1 == shown) ? "\n" : " ");
    }
    if (shown < data.size()) {
        dprintf("... (%zu more bytes)\n", data.size() - shown);
    }
}

int run_capture(std::unique_ptr<USBAdapter> adapter, const RunOptions &options) {
    try {
        dprintf("Opening FLIR One camera...\n");
        auto camera = FlirOne::open(std::move(adapter));
        dprintf("%s\n", camera->describe().c_str());

        camera->connect();
        camera->toggle_communication(Channel::Frame, true);
        dprintf("%s\n", camera->describe().c_str());

        std::vector<uint8_t> config(options.config_buffer_size);
        camera->read(Channel::Config, config, options.bulk_timeout_ms);
        dump_payload("config", config, options.full_dump);

        for (int i = 0; i < options.frame_count; i++) {
            std::vector<uint8_t> frame(options.frame_buffer_size);
            camera->read(Channel::Frame, frame, options.bulk_timeout_ms);
            dump_payload("frame", frame, options.full_dump);
        }

        camera->disconnect();
    } catch (const std::exception &e) {
        dprintf("Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
