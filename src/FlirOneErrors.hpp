#ifndef FLIRONE_ERRORS_HPP
#define FLIRONE_ERRORS_HPP

#include "FlirOneProtocol.hpp"
#include <stdexcept>
#include <string>

enum class ErrorKind {
    DeviceNotFound,
    InterfaceClaimFailed,
    UnexpectedEndpoint,
    MissingEndpoint,
    ControlTransferFailed,
    BulkTransferFailed
};

class FlirOneError : public std::runtime_error {
public:
    FlirOneError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    ErrorKind kind() const { return error_kind; }

private:
    ErrorKind error_kind;
};

// status is the adapter's open status, or 0 when a device was opened but is not the camera.
class DeviceNotFoundError : public FlirOneError {
public:
    DeviceNotFoundError(uint16_t vid, uint16_t pid, int status, const std::string& reason);

    int status() const { return status_code; }

private:
    int status_code;
};

class InterfaceClaimError : public FlirOneError {
public:
    InterfaceClaimError(int status, const std::string& status_name);

    int status() const { return status_code; }

private:
    int status_code;
};

class UnexpectedEndpointError : public FlirOneError {
public:
    UnexpectedEndpointError(EndpointDirection direction, uint8_t number);

    EndpointDirection direction() const { return endpoint_direction; }
    uint8_t number() const { return endpoint_number; }

private:
    EndpointDirection endpoint_direction;
    uint8_t endpoint_number;
};

class MissingEndpointError : public FlirOneError {
public:
    MissingEndpointError(Channel channel, EndpointDirection direction);

    Channel channel() const { return missing_channel; }
    EndpointDirection direction() const { return endpoint_direction; }

private:
    Channel missing_channel;
    EndpointDirection endpoint_direction;
};

// Shared by control and bulk failures; status is the adapter's negative code.
class TransferError : public FlirOneError {
public:
    TransferError(ErrorKind kind, const std::string& what, int status)
        : FlirOneError(kind, what), status_code(status) {}

    int status() const { return status_code; }

private:
    int status_code;
};

class ControlTransferError : public TransferError {
public:
    ControlTransferError(Channel channel, bool start, int status, const std::string& status_name);
};

class BulkTransferError : public TransferError {
public:
    BulkTransferError(Channel channel, EndpointDirection direction, uint8_t address, int status,
                      const std::string& status_name);
};

#endif
