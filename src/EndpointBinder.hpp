#ifndef ENDPOINT_BINDER_HPP
#define ENDPOINT_BINDER_HPP

#include "USBAdapter.hpp"
#include "FlirOneProtocol.hpp"
#include <array>
#include <vector>

struct ChannelEndpoints {
    EndpointInfo read;  // IN
    EndpointInfo write; // OUT
};

// A complete binding: one IN and one OUT endpoint for every channel.
// Only EndpointBinder::build() can produce one.
class BoundEndpoints {
public:
    const ChannelEndpoints& channel(Channel channel) const {
        return channels[FlirOneProtocol::channel_index(channel)];
    }

private:
    friend class EndpointBinder;

    explicit BoundEndpoints(const std::array<ChannelEndpoints, FlirOneProtocol::CHANNEL_COUNT>& bound)
        : channels(bound) {}

    std::array<ChannelEndpoints, FlirOneProtocol::CHANNEL_COUNT> channels;
};

class EndpointBinder {
public:
    // Throws UnexpectedEndpointError for anything outside the numbering contract.
    void add(const EndpointInfo& endpoint);

    // Throws MissingEndpointError naming the first empty slot.
    BoundEndpoints build() const;

private:
    struct Slot {
        bool filled = false;
        EndpointInfo endpoint{};
    };

    std::array<Slot, FlirOneProtocol::CHANNEL_COUNT> read_slots;
    std::array<Slot, FlirOneProtocol::CHANNEL_COUNT> write_slots;
};

BoundEndpoints bind_endpoints(const std::vector<EndpointInfo>& endpoints);

#endif
