#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Glider controller USB identifiers (STMicroelectronics VID)
static const uint16_t GLIDER_VENDOR_ID  = 0x0483;
static const uint16_t GLIDER_PRODUCT_ID = 0x5750;

// Command codes understood by the firmware
static const int16_t USBCMD_REDRAW  = 0x04;
static const int16_t USBCMD_SETMODE = 0x05;

/// Firmware decodes the rect fields one byte off without this filler byte
/// after the parameter word. Must stay in the frame.
static const uint8_t FRAME_PADDING = 0x00;

static const size_t FRAME_PAYLOAD_SIZE = 13;  // cmd(2) + param(2) + pad(1) + rect(8)
static const size_t FRAME_SIZE = FRAME_PAYLOAD_SIZE + 2;

static const size_t SET_MODE_RESPONSE_SIZE = 32;
static const size_t REDRAW_RESPONSE_SIZE = 16;
static const int RESPONSE_TIMEOUT_MS = 200;

// Status word at offset 0 of a response (little-endian)
static const uint16_t STATUS_INVALID_COMMAND = 0x00;
static const uint16_t STATUS_CHECKSUM_MISMATCH = 0x01;
static const uint16_t STATUS_SUCCESS = 0x55;  // anything else is accepted too

/// Rendering modes supported by the display controller
enum class Mode {
    /// 1-bit mode with a custom LUT. Uploading LUTs is not supported here.
    ManualLUTNoDither,
    /// 1-bit custom LUT with error diffusion. Uploading LUTs is not supported here.
    ManualLUTErrorDiffusion,
    /// 1-bit, every grey value becomes black or white
    FastMonoNoDither,
    /// 1-bit with Bayer dithering
    FastMonoBayer,
    /// 1-bit with blue noise dithering
    FastMonoBlueNoise,
    /// 4-level grey, much slower refresh than the other modes
    FastGrey,
    /// 1-bit without dither while the image changes, greyscale once it settles
    AutoNoDither,
    /// Like AutoNoDither, but error diffusion during updates
    AutoErrorDiffusion,
};

/// Rectangular screen region given by two opposite corners.
/// Not validated: ordering and display bounds are up to the firmware.
struct Rect {
    int16_t x0;
    int16_t y0;
    int16_t x1;
    int16_t y1;
};

/// Status reported by the controller
enum class Outcome {
    Success,
    InvalidCommand,
    ChecksumMismatch,
};

using Frame = std::array<uint8_t, FRAME_SIZE>;

/// Firmware wire code of a mode
int16_t mode_code(Mode mode);

/// Mode for a firmware wire code. Throws std::invalid_argument if unknown.
Mode mode_from_code(int16_t code);

/// Canonical mode name, e.g. "FastMonoBayer"
const char* mode_name(Mode mode);

/// Parse a mode name (case-insensitive) or its numeric code.
/// Throws std::invalid_argument for anything else.
Mode parse_mode(const std::string& text);

/// All modes in wire code order
const std::vector<Mode>& all_modes();

/// Build a command frame:
/// cmd (BE) | param (BE) | pad | x0 y0 x1 y1 (LE) | CRC-16/XMODEM (BE)
Frame encode_frame(int16_t command_code, int16_t param, const Rect& area);

/// Build set-mode frame (USBCMD_SETMODE, param = mode code)
Frame build_set_mode_frame(Mode mode, const Rect& area);

/// Build redraw frame (USBCMD_REDRAW, param unused and always zero)
Frame build_redraw_frame(const Rect& area);

/// Read the little-endian status word at offset 0 of a response.
/// Throws ProtocolViolationError if fewer than 2 bytes are given.
uint16_t read_status_word(const uint8_t* data, size_t len);

/// Interpret a response buffer
Outcome decode_status(const uint8_t* data, size_t len);

Outcome decode_status(const std::vector<uint8_t>& response);

const char* outcome_name(Outcome outcome);

/// Space separated hex dump, e.g. "00 05 00 04"
std::string format_hex(const uint8_t* data, size_t len);
