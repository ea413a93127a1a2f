#ifndef FLIRONE_HPP
#define FLIRONE_HPP

#include "USBAdapter.hpp"
#include "FlirOneProtocol.hpp"
#include "FlirOneErrors.hpp"
#include "EndpointBinder.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <memory>

class FlirOne {
public:
    // Opens the camera through the adapter, claims its interfaces and binds
    // the endpoints. Throws DeviceNotFoundError, InterfaceClaimError,
    // UnexpectedEndpointError or MissingEndpointError.
    static std::unique_ptr<FlirOne> open(std::unique_ptr<USBAdapter> adapter);

    FlirOne(std::unique_ptr<USBAdapter> adapter, const BoundEndpoints& endpoints);
    ~FlirOne();

    FlirOne(const FlirOne&) = delete;
    FlirOne& operator=(const FlirOne&) = delete;

    void toggle_communication(Channel channel, bool start);

    // Arms the FileIO channel once. Frame must be armed separately.
    void connect();
    // Stops every armed channel.
    void disconnect();

    bool is_connected() const { return connected; }
    bool is_armed(Channel channel) const;

    size_t read(Channel channel, uint8_t* buffer, size_t length,
                unsigned int timeout_ms = FlirOneProtocol::BULK_TIMEOUT_MS);
    // Reads into data.size() bytes and shrinks data to what arrived.
    size_t read(Channel channel, std::vector<uint8_t>& data,
                unsigned int timeout_ms = FlirOneProtocol::BULK_TIMEOUT_MS);

    size_t write(Channel channel, const uint8_t* data, size_t length,
                 unsigned int timeout_ms = FlirOneProtocol::BULK_TIMEOUT_MS);
    size_t write(Channel channel, const std::vector<uint8_t>& data,
                 unsigned int timeout_ms = FlirOneProtocol::BULK_TIMEOUT_MS);

    const ChannelEndpoints& endpoints(Channel channel) const { return bound.channel(channel); }

    std::string describe() const;

private:
    std::unique_ptr<USBAdapter> adapter;
    BoundEndpoints bound;

    bool connected = false;
    bool expect_file_data = false;
    bool expect_frame_data = false;

    void set_armed(Channel channel, bool armed);
    size_t bulk(Channel channel, const EndpointInfo& endpoint, uint8_t* data, size_t length,
                unsigned int timeout_ms);
};

#endif
