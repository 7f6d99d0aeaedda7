#include "crc16.hpp"

#include <array>

static const uint16_t CRC16_POLY = 0x1021;

static std::array<uint16_t, 256> make_crc16_table() {
    std::array<uint16_t, 256> table{};
    for (int i = 0; i < 256; i++) {
        uint16_t crc = static_cast<uint16_t>(i << 8);
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ CRC16_POLY);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
        table[i] = crc;
    }
    return table;
}

static const std::array<uint16_t, 256> CRC16_TABLE = make_crc16_table();

uint16_t crc16_xmodem(const uint8_t* data, size_t len) {
    uint16_t crc = 0x0000;
    for (size_t i = 0; i < len; i++) {
        uint8_t idx = static_cast<uint8_t>((crc >> 8) ^ data[i]);
        crc = static_cast<uint16_t>((crc << 8) ^ CRC16_TABLE[idx]);
    }
    return crc;
}

uint16_t crc16_xmodem(const std::vector<uint8_t>& data) {
    return crc16_xmodem(data.data(), data.size());
}
