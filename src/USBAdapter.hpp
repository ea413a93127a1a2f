#ifndef USB_ADAPTER_HPP
#define USB_ADAPTER_HPP

#include <vector>
#include <cstdint>
#include <string>

enum class EndpointDirection : uint8_t {
    In,
    Out
};

struct EndpointInfo {
    uint8_t address;          // bEndpointAddress, direction bit included
    EndpointDirection direction;
    uint8_t number;           // address & 0x0F
    uint8_t interface_number;
};

// Host USB stack surface. Transfer calls return a negative status code on
// failure; error_name() turns it into something printable.
class USBAdapter {
public:
    virtual ~USBAdapter() = default;

    // Opens the first device with this VID/PID. Returns 0 or a negative status,
    // which also covers a host stack that failed to initialize.
    virtual int connect(uint16_t vid, uint16_t pid) = 0;
    virtual void disconnect() = 0;

    virtual bool device_ids(uint16_t& vid, uint16_t& pid) const = 0;

    // Claims every interface of the active configuration. Returns 0 or a negative status.
    virtual int claim_interfaces() = 0;

    // Every endpoint of every claimed interface, in descriptor order.
    virtual std::vector<EndpointInfo> endpoints() = 0;

    // Returns bytes transferred in the data stage, or a negative status.
    virtual int control_transfer(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
                                 uint8_t* data, uint16_t length, unsigned int timeout_ms) = 0;

    // Returns 0 or a negative status. *transferred is valid in both cases.
    virtual int bulk_transfer(uint8_t endpoint_address, uint8_t* data, int length, int* transferred,
                              unsigned int timeout_ms) = 0;

    virtual std::string error_name(int status) const = 0;
};

#endif
