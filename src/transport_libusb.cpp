#include "transport_libusb.hpp"
#include "glider_error.hpp"

#include <libusb-1.0/libusb.h>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

// HID class request (HID 1.11, section 7.2)
static const uint8_t HID_SET_REPORT = 0x09;
static const uint16_t HID_REPORT_TYPE_OUTPUT = 0x02;

static const unsigned int WRITE_TIMEOUT_MS = 1000;

static std::string usb_error(const char* what, int ret) {
    return std::string(what) + ": " + libusb_error_name(ret);
}

LibusbTransport::LibusbTransport(uint16_t vendor_id, uint16_t product_id)
    : vendor_id_(vendor_id), product_id_(product_id) {}

LibusbTransport::~LibusbTransport() {
    close();
}

void LibusbTransport::open() {
    if (usb_handle_) return;

    libusb_context* ctx = nullptr;
    int ret = libusb_init(&ctx);
    if (ret < 0) {
        throw TransportUnavailableError(usb_error("Failed to initialize libusb", ret));
    }
    usb_ctx_ = ctx;

    libusb_device_handle* handle = libusb_open_device_with_vid_pid(ctx, vendor_id_, product_id_);
    if (!handle) {
        std::ostringstream oss;
        oss << "Display controller " << std::hex << std::setw(4) << std::setfill('0')
            << vendor_id_ << ":" << std::setw(4) << product_id_
            << " not found (is it connected?)";
        close();
        throw TransportUnavailableError(oss.str());
    }
    usb_handle_ = handle;

    try {
        find_hid_interface();
    } catch (...) {
        close();
        throw;
    }

    // Kernel HID driver is detached on claim and reattached on release
    libusb_set_auto_detach_kernel_driver(handle, 1);

    ret = libusb_claim_interface(handle, interface_);
    if (ret < 0) {
        close();
        throw TransportUnavailableError(usb_error("Failed to claim USB interface", ret));
    }
    interface_claimed_ = true;
}

void LibusbTransport::find_hid_interface() {
    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    libusb_device* dev = libusb_get_device(handle);
    libusb_config_descriptor* config = nullptr;
    int ret = libusb_get_active_config_descriptor(dev, &config);
    if (ret < 0) {
        throw TransportUnavailableError(usb_error("Failed to read USB configuration", ret));
    }

    bool found = false;
    for (int i = 0; i < config->bNumInterfaces && !found; i++) {
        const libusb_interface_descriptor& alt = config->interface[i].altsetting[0];
        if (alt.bInterfaceClass != LIBUSB_CLASS_HID) continue;

        found = true;
        interface_ = alt.bInterfaceNumber;
        ep_in_ = 0;
        ep_out_ = 0;
        for (int e = 0; e < alt.bNumEndpoints; e++) {
            const libusb_endpoint_descriptor& ep = alt.endpoint[e];
            if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_INTERRUPT) {
                continue;
            }
            if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) != 0) {
                ep_in_ = ep.bEndpointAddress;
                in_packet_size_ = ep.wMaxPacketSize;
            } else {
                ep_out_ = ep.bEndpointAddress;
            }
        }
    }

    libusb_free_config_descriptor(config);

    if (!found) {
        throw TransportUnavailableError("No HID interface on display controller");
    }
    if (!ep_in_) {
        throw TransportUnavailableError("Could not find HID interrupt IN endpoint");
    }
}

void LibusbTransport::close() {
    if (usb_handle_) {
        auto handle = static_cast<libusb_device_handle*>(usb_handle_);
        if (interface_claimed_) {
            libusb_release_interface(handle, interface_);
            interface_claimed_ = false;
        }
        libusb_close(handle);
        usb_handle_ = nullptr;
    }
    if (usb_ctx_) {
        libusb_exit(static_cast<libusb_context*>(usb_ctx_));
        usb_ctx_ = nullptr;
    }
}

void LibusbTransport::set_report(uint8_t report_id, const uint8_t* data, size_t len) {
    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    int ret = libusb_control_transfer(
        handle,
        LIBUSB_ENDPOINT_OUT | LIBUSB_REQUEST_TYPE_CLASS | LIBUSB_RECIPIENT_INTERFACE,
        HID_SET_REPORT,
        static_cast<uint16_t>((HID_REPORT_TYPE_OUTPUT << 8) | report_id),
        static_cast<uint16_t>(interface_),
        const_cast<uint8_t*>(data), static_cast<uint16_t>(len),
        WRITE_TIMEOUT_MS);
    if (ret < 0) {
        throw TransportIoError(usb_error("HID SET_REPORT failed", ret));
    }
}

void LibusbTransport::write(const std::vector<uint8_t>& data) {
    if (!usb_handle_) {
        throw TransportIoError("Display controller not open");
    }
    if (data.empty()) {
        throw TransportIoError("Empty HID report");
    }

    // Report number 0 is not sent on the wire
    uint8_t report_id = data[0];
    const uint8_t* payload = data.data();
    size_t len = data.size();
    if (report_id == 0) {
        payload++;
        len--;
    }

    if (!ep_out_) {
        set_report(report_id, payload, len);
        return;
    }

    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    int transferred = 0;
    int ret = libusb_interrupt_transfer(handle, ep_out_,
        const_cast<uint8_t*>(payload), (int)len, &transferred, WRITE_TIMEOUT_MS);
    if (ret < 0) {
        throw TransportIoError(usb_error("USB write failed", ret));
    }
    if ((size_t)transferred != len) {
        std::ostringstream oss;
        oss << "USB write incomplete (" << transferred << "/" << len << " bytes)";
        throw TransportIoError(oss.str());
    }
}

size_t LibusbTransport::read_timeout(uint8_t* buf, size_t len, int timeout_ms) {
    if (!usb_handle_) {
        throw TransportIoError("Display controller not open");
    }

    // Always read a full packet, a shorter buffer makes libusb report overflow
    auto handle = static_cast<libusb_device_handle*>(usb_handle_);
    std::vector<uint8_t> packet(std::max<size_t>(in_packet_size_, len));
    int transferred = 0;
    int ret = libusb_interrupt_transfer(handle, ep_in_, packet.data(), (int)packet.size(),
                                        &transferred, (unsigned int)timeout_ms);
    if (ret == LIBUSB_ERROR_TIMEOUT) {
        std::ostringstream oss;
        oss << "No response from display controller within " << timeout_ms << " ms";
        throw TimeoutError(oss.str());
    }
    if (ret < 0) {
        throw TransportIoError(usb_error("USB read failed", ret));
    }

    size_t n = std::min(len, (size_t)transferred);
    std::memcpy(buf, packet.data(), n);
    return n;
}

// Factory function for libusb backend
#ifdef GLIDER_BACKEND_LIBUSB
std::unique_ptr<HidTransport> create_hid_transport(const TransportOptions& options) {
    return std::make_unique<LibusbTransport>(options.vendor_id, options.product_id);
}
#endif
