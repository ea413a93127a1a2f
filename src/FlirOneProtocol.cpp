#include "FlirOneProtocol.hpp"

namespace FlirOneProtocol {

namespace {
    struct EndpointSlot {
        EndpointDirection direction;
        uint8_t number;
        Channel channel;
    };

    const EndpointSlot endpoint_table[] = {
        {EndpointDirection::In, 1, Channel::Config},
        {EndpointDirection::Out, 2, Channel::Config},
        {EndpointDirection::In, 3, Channel::FileIO},
        {EndpointDirection::Out, 4, Channel::FileIO},
        {EndpointDirection::In, 5, Channel::Frame},
        {EndpointDirection::Out, 6, Channel::Frame},
    };
}

bool classify_endpoint(EndpointDirection direction, uint8_t number, Channel& channel) {
    for (const auto& slot : endpoint_table) {
        if (slot.direction == direction && slot.number == number) {
            channel = slot.channel;
            return true;
        }
    }
    return false;
}

const char* channel_name(Channel channel) {
    switch (channel) {
        case Channel::Config: return "config";
        case Channel::FileIO: return "fileio";
        case Channel::Frame: return "frame";
    }
    return "unknown";
}

const char* direction_name(EndpointDirection direction) {
    return direction == EndpointDirection::In ? "IN" : "OUT";
}

}
