#pragma once

#include "hid_transport.hpp"
#include <cstdint>
#include <string>

/// Linux hidraw transport. Uses device_path if given, otherwise the first
/// /dev/hidrawN node whose USB vendor/product IDs match.
class HidrawTransport : public HidTransport {
public:
    HidrawTransport(const std::string& device_path, uint16_t vendor_id, uint16_t product_id);
    ~HidrawTransport() override;

    void open() override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }
    void write(const std::vector<uint8_t>& data) override;
    size_t read_timeout(uint8_t* buf, size_t len, int timeout_ms) override;

private:
    int open_matching_node();

    std::string device_path_;
    uint16_t vendor_id_;
    uint16_t product_id_;
    int fd_ = -1;
};
