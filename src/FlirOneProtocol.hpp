#ifndef FLIRONE_PROTOCOL_HPP
#define FLIRONE_PROTOCOL_HPP

#include "USBAdapter.hpp"
#include <cstdint>
#include <cstddef>

enum class Channel : uint8_t {
    Config = 0,
    FileIO = 1,
    Frame = 2
};

namespace FlirOneProtocol {
    constexpr uint16_t VID = 0x09CB;
    constexpr uint16_t PID = 0x1996;

    // Channel enable/disable: host-to-device, vendor request, no data stage.
    // wValue is 1 to start or 0 to stop, wIndex is the channel index.
    constexpr uint8_t TOGGLE_REQUEST_TYPE = 0x01;
    constexpr uint8_t TOGGLE_REQUEST = 11;
    constexpr uint16_t TOGGLE_START = 1;
    constexpr uint16_t TOGGLE_STOP = 0;

    constexpr unsigned int CONTROL_TIMEOUT_MS = 1000;
    constexpr unsigned int BULK_TIMEOUT_MS = 30000;

    // Empirical capacities for this camera model, not derived from any header.
    constexpr size_t CONFIG_READ_BUFFER_SIZE = 4096;
    constexpr size_t FRAME_READ_BUFFER_SIZE = 131072;

    constexpr size_t CHANNEL_COUNT = 3;
    constexpr Channel ALL_CHANNELS[CHANNEL_COUNT] = {Channel::Config, Channel::FileIO, Channel::Frame};

    constexpr uint16_t channel_index(Channel channel) {
        return static_cast<uint16_t>(channel);
    }

    // Config is readable without being armed, so the session keeps no flag for it.
    constexpr bool tracks_armed_state(Channel channel) {
        return channel != Channel::Config;
    }

    // Endpoint numbering contract: IN 1/3/5 and OUT 2/4/6 for Config/FileIO/Frame.
    // Returns false for any other (direction, number).
    bool classify_endpoint(EndpointDirection direction, uint8_t number, Channel& channel);

    const char* channel_name(Channel channel);
    const char* direction_name(EndpointDirection direction);
}

#endif
