#include "EndpointBinder.hpp"
#include "FlirOneErrors.hpp"
#include "Log.hpp"

void EndpointBinder::add(const EndpointInfo& endpoint) {
    Channel channel;
    if (!FlirOneProtocol::classify_endpoint(endpoint.direction, endpoint.number, channel)) {
        throw UnexpectedEndpointError(endpoint.direction, endpoint.number);
    }

    auto& slots = endpoint.direction == EndpointDirection::In ? read_slots : write_slots;
    Slot& slot = slots[FlirOneProtocol::channel_index(channel)];
    slot.filled = true;
    slot.endpoint = endpoint;

    dprintf("EndpointBinder::add() - Endpoint 0x%02X (interface %d) -> %s %s\n", endpoint.address,
            endpoint.interface_number, FlirOneProtocol::channel_name(channel),
            FlirOneProtocol::direction_name(endpoint.direction));
}

BoundEndpoints EndpointBinder::build() const {
    std::array<ChannelEndpoints, FlirOneProtocol::CHANNEL_COUNT> bound;
    for (Channel channel : FlirOneProtocol::ALL_CHANNELS) {
        auto i = FlirOneProtocol::channel_index(channel);
        if (!read_slots[i].filled) throw MissingEndpointError(channel, EndpointDirection::In);
        if (!write_slots[i].filled) throw MissingEndpointError(channel, EndpointDirection::Out);
        bound[i].read = read_slots[i].endpoint;
        bound[i].write = write_slots[i].endpoint;
    }
    return BoundEndpoints(bound);
}

BoundEndpoints bind_endpoints(const std::vector<EndpointInfo>& endpoints) {
    EndpointBinder binder;
    for (const auto& endpoint : endpoints) {
        binder.add(endpoint);
    }
    return binder.build();
}
