#ifndef LIBUSB_ADAPTER_HPP
#define LIBUSB_ADAPTER_HPP

#include "USBAdapter.hpp"
#include <libusb-1.0/libusb.h>

class LibusbAdapter : public USBAdapter {
public:
    explicit LibusbAdapter(bool debug_log = false);

    virtual ~LibusbAdapter();

    int connect(uint16_t vid, uint16_t pid) override;

    void disconnect() override;

    bool device_ids(uint16_t &vid, uint16_t &pid) const override;

    int claim_interfaces() override;

    std::vector<EndpointInfo> endpoints() override;

    int control_transfer(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
                         uint8_t *data, uint16_t length, unsigned int timeout_ms) override;

    int bulk_transfer(uint8_t endpoint_address, uint8_t *data, int length, int *transferred,
                      unsigned int timeout_ms) override;

    std::string error_name(int status) const override;

private:
    libusb_context *ctx = nullptr;
    int init_status = 0;
    libusb_device_handle *dev_handle = nullptr;
    std::vector<int> claimed_interfaces;
};

#endif
