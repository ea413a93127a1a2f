#include "FlirOne.hpp"
#include "Log.hpp"
#include <climits>
#include <exception>
#include <initializer_list>
#include <sstream>
#include <iomanip>
#include <algorithm>

std::unique_ptr<FlirOne> FlirOne::open(std::unique_ptr<USBAdapter> adapter) {
    int res = adapter->connect(FlirOneProtocol::VID, FlirOneProtocol::PID);
    if (res < 0) {
        throw DeviceNotFoundError(FlirOneProtocol::VID, FlirOneProtocol::PID, res, adapter->error_name(res));
    }

    uint16_t vid = 0;
    uint16_t pid = 0;
    if (!adapter->device_ids(vid, pid) || vid != FlirOneProtocol::VID || pid != FlirOneProtocol::PID) {
        dprintf("FlirOne::open() - Opened device reports VID: 0x%04X, PID: 0x%04X, refusing it.\n", vid, pid);
        adapter->disconnect();
        throw DeviceNotFoundError(FlirOneProtocol::VID, FlirOneProtocol::PID, 0, "opened device has another identity");
    }

    res = adapter->claim_interfaces();
    if (res < 0) {
        std::string name = adapter->error_name(res);
        adapter->disconnect();
        throw InterfaceClaimError(res, name);
    }

    BoundEndpoints endpoints = bind_endpoints(adapter->endpoints());
    return std::make_unique<FlirOne>(std::move(adapter), endpoints);
}

FlirOne::FlirOne(std::unique_ptr<USBAdapter> adapter, const BoundEndpoints& endpoints)
    : adapter(std::move(adapter)), bound(endpoints) {}

FlirOne::~FlirOne() {
    try {
        disconnect();
    } catch (const FlirOneError& e) {
        dprintf("FlirOne::~FlirOne() - Disconnect failed: %s\n", e.what());
    }
}

void FlirOne::toggle_communication(Channel channel, bool start) {
    uint16_t value = start ? FlirOneProtocol::TOGGLE_START : FlirOneProtocol::TOGGLE_STOP;
    uint16_t index = FlirOneProtocol::channel_index(channel);

    int res = adapter->control_transfer(FlirOneProtocol::TOGGLE_REQUEST_TYPE, FlirOneProtocol::TOGGLE_REQUEST,
                                        value, index, nullptr, 0, FlirOneProtocol::CONTROL_TIMEOUT_MS);
    if (res < 0) {
        dprintf("FlirOne::toggle_communication() - %s %s failed: %s\n", start ? "start" : "stop",
                FlirOneProtocol::channel_name(channel), adapter->error_name(res).c_str());
        throw ControlTransferError(channel, start, res, adapter->error_name(res));
    }
    dprintf("FlirOne::toggle_communication() - %s %s, res %d\n", start ? "start" : "stop",
            FlirOneProtocol::channel_name(channel), res);

    set_armed(channel, start);
}

void FlirOne::connect() {
    if (connected) return;
    connected = true;
    toggle_communication(Channel::FileIO, true);
}

void FlirOne::disconnect() {
    if (!connected && !expect_file_data && !expect_frame_data) return;
    connected = false;

    std::exception_ptr first_failure;
    for (Channel channel : {Channel::Frame, Channel::FileIO}) {
        if (!is_armed(channel)) continue;
        try {
            toggle_communication(channel, false);
        } catch (const ControlTransferError&) {
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) std::rethrow_exception(first_failure);
}

bool FlirOne::is_armed(Channel channel) const {
    switch (channel) {
        case Channel::FileIO: return expect_file_data;
        case Channel::Frame: return expect_frame_data;
        case Channel::Config: break;
    }
    return false;
}

void FlirOne::set_armed(Channel channel, bool armed) {
    if (!FlirOneProtocol::tracks_armed_state(channel)) return;
    if (channel == Channel::FileIO) {
        expect_file_data = armed;
    } else {
        expect_frame_data = armed;
    }
}

size_t FlirOne::read(Channel channel, uint8_t* buffer, size_t length, unsigned int timeout_ms) {
    if (FlirOneProtocol::tracks_armed_state(channel) && !is_armed(channel)) {
        dprintf("FlirOne::read() - Warning: reading %s channel before it was started.\n",
                FlirOneProtocol::channel_name(channel));
    }
    return bulk(channel, bound.channel(channel).read, buffer, length, timeout_ms);
}

size_t FlirOne::read(Channel channel, std::vector<uint8_t>& data, unsigned int timeout_ms) {
    size_t n = read(channel, data.data(), data.size(), timeout_ms);
    data.resize(n);
    return n;
}

size_t FlirOne::write(Channel channel, const uint8_t* data, size_t length, unsigned int timeout_ms) {
    // libusb takes a non-const buffer for both directions; OUT transfers do not modify it.
    return bulk(channel, bound.channel(channel).write, const_cast<uint8_t*>(data), length, timeout_ms);
}

size_t FlirOne::write(Channel channel, const std::vector<uint8_t>& data, unsigned int timeout_ms) {
    return write(channel, data.data(), data.size(), timeout_ms);
}

size_t FlirOne::bulk(Channel channel, const EndpointInfo& endpoint, uint8_t* data, size_t length,
                     unsigned int timeout_ms) {
    int transferred = 0;
    int len = static_cast<int>(std::min(length, static_cast<size_t>(INT_MAX)));
    int res = adapter->bulk_transfer(endpoint.address, data, len, &transferred, timeout_ms);
    if (res < 0) {
        dprintf("FlirOne::bulk() - Endpoint 0x%02X failed after %d bytes: %s\n", endpoint.address, transferred,
                adapter->error_name(res).c_str());
        throw BulkTransferError(channel, endpoint.direction, endpoint.address, res, adapter->error_name(res));
    }
    return static_cast<size_t>(transferred);
}

std::string FlirOne::describe() const {
    std::ostringstream oss;
    oss << std::boolalpha;
    oss << "FlirOne {\n";
    oss << "  connected: " << connected << "\n";
    oss << "  expect_file_data: " << expect_file_data << "\n";
    oss << "  expect_frame_data: " << expect_frame_data << "\n";
    for (Channel channel : FlirOneProtocol::ALL_CHANNELS) {
        const ChannelEndpoints& ep = bound.channel(channel);
        oss << "  " << FlirOneProtocol::channel_name(channel) << ": IN 0x" << std::hex << std::setw(2)
            << std::setfill('0') << (int) ep.read.address << ", OUT 0x" << std::setw(2) << (int) ep.write.address
            << std::dec << std::setfill(' ') << "\n";
    }
    oss << "}";
    return oss.str();
}
