#include "LibusbAdapter.hpp"
#include "Log.hpp"

LibusbAdapter::LibusbAdapter(bool debug_log) {
    int res = libusb_init(&ctx);
    if (res < 0) {
        dprintf("LibusbAdapter - Failed to initialize libusb: %s\n", libusb_error_name(res));
        init_status = res;
        ctx = nullptr;
        return;
    }
    if (debug_log) {
        libusb_set_option(ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }
}

LibusbAdapter::~LibusbAdapter() {
    disconnect();
    if (ctx) {
        libusb_exit(ctx);
    }
}

int LibusbAdapter::connect(uint16_t vid, uint16_t pid) {
    if (!ctx) {
        dprintf("LibusbAdapter::connect() - libusb is not initialized: %s\n", libusb_error_name(init_status));
        return init_status;
    }
    if (dev_handle) return 0;

    dprintf("LibusbAdapter::connect() - Searching for device VID: 0x%04X, PID: 0x%04X\n", vid, pid);
    libusb_device **device_list = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx, &device_list);
    if (cnt < 0) {
        dprintf("LibusbAdapter::connect() - Device enumeration failed: %s\n", libusb_error_name((int) cnt));
        return (int) cnt;
    }

    int res = LIBUSB_ERROR_NOT_FOUND;
    for (ssize_t i = 0; i < cnt; i++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(device_list[i], &desc) < 0) continue;
        if (desc.idVendor != vid || desc.idProduct != pid) continue;
        res = libusb_open(device_list[i], &dev_handle);
        break;
    }
    libusb_free_device_list(device_list, 1);

    if (res < 0) {
        // LIBUSB_ERROR_ACCESS here usually means a missing udev rule.
        dprintf("LibusbAdapter::connect() - Cannot open device: %s\n", libusb_error_name(res));
        dev_handle = nullptr;
        return res;
    }

    // The camera's interfaces are vendor specific, but a generic driver may still hold them.
    libusb_set_auto_detach_kernel_driver(dev_handle, 1);

    dprintf("LibusbAdapter::connect() - Device opened successfully.\n");
    return 0;
}

void LibusbAdapter::disconnect() {
    if (!dev_handle) return;
    for (int number : claimed_interfaces) {
        int res = libusb_release_interface(dev_handle, number);
        if (res < 0) {
            dprintf("LibusbAdapter::disconnect() - Release of interface %d failed: %s\n", number,
                    libusb_error_name(res));
        }
    }
    claimed_interfaces.clear();
    libusb_close(dev_handle);
    dev_handle = nullptr;
}

bool LibusbAdapter::device_ids(uint16_t &vid, uint16_t &pid) const {
    if (!dev_handle) return false;

    libusb_device_descriptor desc;
    if (libusb_get_device_descriptor(libusb_get_device(dev_handle), &desc) < 0) return false;
    vid = desc.idVendor;
    pid = desc.idProduct;
    return true;
}

int LibusbAdapter::claim_interfaces() {
    if (!dev_handle) return LIBUSB_ERROR_NO_DEVICE;

    libusb_config_descriptor *config = nullptr;
    int res = libusb_get_active_config_descriptor(libusb_get_device(dev_handle), &config);
    if (res < 0) return res;

    for (int i = 0; i < config->bNumInterfaces; i++) {
        int number = config->interface[i].altsetting[0].bInterfaceNumber;
        res = libusb_claim_interface(dev_handle, number);
        if (res < 0) {
            dprintf("LibusbAdapter::claim_interfaces() - Interface %d: %s\n", number, libusb_error_name(res));
            libusb_free_config_descriptor(config);
            return res;
        }
        dprintf("LibusbAdapter::claim_interfaces() - Claimed interface %d\n", number);
        claimed_interfaces.push_back(number);
    }

    libusb_free_config_descriptor(config);
    return 0;
}

std::vector<EndpointInfo> LibusbAdapter::endpoints() {
    std::vector<EndpointInfo> result;
    if (!dev_handle) return result;

    libusb_config_descriptor *config = nullptr;
    if (libusb_get_active_config_descriptor(libusb_get_device(dev_handle), &config) < 0) return result;

    for (int i = 0; i < config->bNumInterfaces; i++) {
        const libusb_interface &interface = config->interface[i];
        for (int a = 0; a < interface.num_altsetting; a++) {
            const libusb_interface_descriptor &interfaceDesc = interface.altsetting[a];
            for (int e = 0; e < interfaceDesc.bNumEndpoints; e++) {
                const libusb_endpoint_descriptor &epDesc = interfaceDesc.endpoint[e];
                EndpointInfo info;
                info.address = epDesc.bEndpointAddress;
                info.direction = (epDesc.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN
                                     ? EndpointDirection::In
                                     : EndpointDirection::Out;
                info.number = epDesc.bEndpointAddress & LIBUSB_ENDPOINT_ADDRESS_MASK;
                info.interface_number = interfaceDesc.bInterfaceNumber;
                result.push_back(info);
            }
        }
    }

    libusb_free_config_descriptor(config);
    return result;
}

int LibusbAdapter::control_transfer(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index,
                                    uint8_t *data, uint16_t length, unsigned int timeout_ms) {
    if (!dev_handle) return LIBUSB_ERROR_NO_DEVICE;

    return libusb_control_transfer(dev_handle, request_type, request, value, index, data, length, timeout_ms);
}

int LibusbAdapter::bulk_transfer(uint8_t endpoint_address, uint8_t *data, int length, int *transferred,
                                 unsigned int timeout_ms) {
    *transferred = 0;
    if (!dev_handle) return LIBUSB_ERROR_NO_DEVICE;

    return libusb_bulk_transfer(dev_handle, endpoint_address, data, length, transferred, timeout_ms);
}

std::string LibusbAdapter::error_name(int status) const {
    return libusb_error_name(status);
}
