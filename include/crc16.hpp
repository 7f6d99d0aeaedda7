#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// CRC-16/XMODEM (poly 0x1021, init 0x0000, no reflection, no final xor)
uint16_t crc16_xmodem(const uint8_t* data, size_t len);

uint16_t crc16_xmodem(const std::vector<uint8_t>& data);
