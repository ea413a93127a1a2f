#include "FlirOneErrors.hpp"
#include <cstdio>

namespace {
    std::string hex16(uint16_t value) {
        char buf[8];
        snprintf(buf, sizeof(buf), "0x%04X", value);
        return buf;
    }

    std::string hex8(uint8_t value) {
        char buf[8];
        snprintf(buf, sizeof(buf), "0x%02X", value);
        return buf;
    }
}

DeviceNotFoundError::DeviceNotFoundError(uint16_t vid, uint16_t pid, int status, const std::string& reason)
    : FlirOneError(ErrorKind::DeviceNotFound,
                   "no device with VID " + hex16(vid) + ", PID " + hex16(pid) + ": " + reason),
      status_code(status) {}

InterfaceClaimError::InterfaceClaimError(int status, const std::string& status_name)
    : FlirOneError(ErrorKind::InterfaceClaimFailed, "failed to claim interface: " + status_name),
      status_code(status) {}

UnexpectedEndpointError::UnexpectedEndpointError(EndpointDirection direction, uint8_t number)
    : FlirOneError(ErrorKind::UnexpectedEndpoint,
                   std::string("unexpected endpoint ") + FlirOneProtocol::direction_name(direction) + " " +
                   std::to_string(number)),
      endpoint_direction(direction), endpoint_number(number) {}

MissingEndpointError::MissingEndpointError(Channel channel, EndpointDirection direction)
    : FlirOneError(ErrorKind::MissingEndpoint,
                   std::string("missing ") + FlirOneProtocol::direction_name(direction) + " endpoint for " +
                   FlirOneProtocol::channel_name(channel) + " channel"),
      missing_channel(channel), endpoint_direction(direction) {}

ControlTransferError::ControlTransferError(Channel channel, bool start, int status, const std::string& status_name)
    : TransferError(ErrorKind::ControlTransferFailed,
                    std::string("failed to ") + (start ? "start " : "stop ") + FlirOneProtocol::channel_name(channel) +
                    " channel: " + status_name,
                    status) {}

BulkTransferError::BulkTransferError(Channel channel, EndpointDirection direction, uint8_t address, int status,
                                     const std::string& status_name)
    : TransferError(ErrorKind::BulkTransferFailed,
                    std::string("bulk ") + (direction == EndpointDirection::In ? "read" : "write") + " on " +
                    FlirOneProtocol::channel_name(channel) + " endpoint " + hex8(address) + " failed: " +
                    status_name,
                    status) {}
