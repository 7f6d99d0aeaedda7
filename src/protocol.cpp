#include "protocol.hpp"
#include "crc16.hpp"
#include "glider_error.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

// Mode -> firmware code. Codes are fixed by the firmware, never renumber.
static const std::map<Mode, int16_t> MODE_TO_CODE = {
    {Mode::ManualLUTNoDither,       0},
    {Mode::ManualLUTErrorDiffusion, 1},
    {Mode::FastMonoNoDither,        2},
    {Mode::FastMonoBayer,           3},
    {Mode::FastMonoBlueNoise,       4},
    {Mode::FastGrey,                5},
    {Mode::AutoNoDither,            6},
    {Mode::AutoErrorDiffusion,      7},
};

static const std::map<Mode, const char*> MODE_TO_NAME = {
    {Mode::ManualLUTNoDither,       "ManualLUTNoDither"},
    {Mode::ManualLUTErrorDiffusion, "ManualLUTErrorDiffusion"},
    {Mode::FastMonoNoDither,        "FastMonoNoDither"},
    {Mode::FastMonoBayer,           "FastMonoBayer"},
    {Mode::FastMonoBlueNoise,       "FastMonoBlueNoise"},
    {Mode::FastGrey,                "FastGrey"},
    {Mode::AutoNoDither,            "AutoNoDither"},
    {Mode::AutoErrorDiffusion,      "AutoErrorDiffusion"},
};

int16_t mode_code(Mode mode) {
    return MODE_TO_CODE.at(mode);
}

Mode mode_from_code(int16_t code) {
    for (const auto& entry : MODE_TO_CODE) {
        if (entry.second == code) return entry.first;
    }
    throw std::invalid_argument("Unknown mode code " + std::to_string(code));
}

const char* mode_name(Mode mode) {
    return MODE_TO_NAME.at(mode);
}

const std::vector<Mode>& all_modes() {
    static const std::vector<Mode> modes = [] {
        std::vector<std::pair<int16_t, Mode>> by_code;
        for (const auto& entry : MODE_TO_CODE) {
            by_code.emplace_back(entry.second, entry.first);
        }
        std::sort(by_code.begin(), by_code.end());
        std::vector<Mode> result;
        for (const auto& entry : by_code) result.push_back(entry.second);
        return result;
    }();
    return modes;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Mode parse_mode(const std::string& text) {
    std::string wanted = to_lower(text);
    for (const auto& entry : MODE_TO_NAME) {
        if (to_lower(entry.second) == wanted) return entry.first;
    }

    if (!text.empty() && std::all_of(text.begin(), text.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        if (text.size() <= 4) return mode_from_code(static_cast<int16_t>(std::stoi(text)));
    }

    throw std::invalid_argument("Unknown mode: " + text);
}

//--- Frame encoding ---

static void put_i16_be(uint8_t* out, int16_t value) {
    uint16_t v = static_cast<uint16_t>(value);
    out[0] = static_cast<uint8_t>(v >> 8);
    out[1] = static_cast<uint8_t>(v & 0xFF);
}

static void put_i16_le(uint8_t* out, int16_t value) {
    uint16_t v = static_cast<uint16_t>(value);
    out[0] = static_cast<uint8_t>(v & 0xFF);
    out[1] = static_cast<uint8_t>(v >> 8);
}

Frame encode_frame(int16_t command_code, int16_t param, const Rect& area) {
    Frame frame{};
    // Header is big-endian, rect is little-endian: two encoders in the firmware
    put_i16_be(&frame[0], command_code);
    put_i16_be(&frame[2], param);
    frame[4] = FRAME_PADDING;
    put_i16_le(&frame[5], area.x0);
    put_i16_le(&frame[7], area.y0);
    put_i16_le(&frame[9], area.x1);
    put_i16_le(&frame[11], area.y1);

    uint16_t crc = crc16_xmodem(frame.data(), FRAME_PAYLOAD_SIZE);
    frame[13] = static_cast<uint8_t>(crc >> 8);
    frame[14] = static_cast<uint8_t>(crc & 0xFF);
    return frame;
}

Frame build_set_mode_frame(Mode mode, const Rect& area) {
    return encode_frame(USBCMD_SETMODE, mode_code(mode), area);
}

Frame build_redraw_frame(const Rect& area) {
    return encode_frame(USBCMD_REDRAW, 0x0000, area);
}

//--- Response decoding ---

uint16_t read_status_word(const uint8_t* data, size_t len) {
    if (len < 2) {
        std::ostringstream oss;
        oss << "Response too short for status word (" << len << " bytes)";
        throw ProtocolViolationError(oss.str());
    }
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

Outcome decode_status(const uint8_t* data, size_t len) {
    switch (read_status_word(data, len)) {
        case STATUS_INVALID_COMMAND:   return Outcome::InvalidCommand;
        case STATUS_CHECKSUM_MISMATCH: return Outcome::ChecksumMismatch;
        default:                       return Outcome::Success;
    }
}

Outcome decode_status(const std::vector<uint8_t>& response) {
    return decode_status(response.data(), response.size());
}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success:          return "success";
        case Outcome::InvalidCommand:   return "invalid command";
        case Outcome::ChecksumMismatch: return "checksum incorrect";
    }
    return "unknown";
}

std::string format_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; i++) {
        if (i) oss << ' ';
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return oss.str();
}
