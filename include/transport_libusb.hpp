#pragma once

#include "hid_transport.hpp"
#include <cstdint>
#include <vector>

/// libusb-1.0 HID transport: interrupt endpoints, SET_REPORT fallback for output
class LibusbTransport : public HidTransport {
public:
    LibusbTransport(uint16_t vendor_id, uint16_t product_id);
    ~LibusbTransport() override;

    void open() override;
    void close() override;
    bool is_open() const override { return usb_handle_ != nullptr; }
    void write(const std::vector<uint8_t>& data) override;
    size_t read_timeout(uint8_t* buf, size_t len, int timeout_ms) override;

private:
    void find_hid_interface();
    void set_report(uint8_t report_id, const uint8_t* data, size_t len);

    uint16_t vendor_id_;
    uint16_t product_id_;

    void* usb_ctx_ = nullptr;     // libusb_context*
    void* usb_handle_ = nullptr;  // libusb_device_handle*
    int interface_ = 0;
    bool interface_claimed_ = false;
    uint8_t ep_out_ = 0;
    uint8_t ep_in_ = 0;
    uint16_t in_packet_size_ = 64;
};
