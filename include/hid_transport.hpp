#pragma once

#include "protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/// Where to find the display controller
struct TransportOptions {
    uint16_t vendor_id = GLIDER_VENDOR_ID;
    uint16_t product_id = GLIDER_PRODUCT_ID;
    std::string device_path;  // hidraw node, e.g. /dev/hidraw0
};

/// Abstract HID transport for the display controller.
/// One request/response pair at a time; callers serialise access.
class HidTransport {
public:
    virtual ~HidTransport() = default;

    /// Open the device. Throws TransportUnavailableError on failure.
    virtual void open() = 0;

    /// Close the device (no-op if not open)
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Write one output report. data[0] is the report number; report 0
    /// means the device has unnumbered reports and the byte is not sent.
    /// Throws TransportIoError on failure.
    virtual void write(const std::vector<uint8_t>& data) = 0;

    /// Read one input report into buf (truncated to len), returns bytes read.
    /// Throws TimeoutError when nothing arrives within timeout_ms,
    /// TransportIoError on failure.
    virtual size_t read_timeout(uint8_t* buf, size_t len, int timeout_ms) = 0;
};

/// Create the default HID transport (selected at build time)
std::unique_ptr<HidTransport> create_hid_transport(const TransportOptions& options = {});
