#include "glider_display.hpp"
#include "glider_error.hpp"

#include <iostream>
#include <utility>

Display::Display(const TransportOptions& options)
    : transport_(create_hid_transport(options)) {}

Display::Display(std::unique_ptr<HidTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw TransportUnavailableError("No transport given");
    }
}

Display::~Display() {
    close();
}

void Display::connect() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!transport_->is_open()) {
        transport_->open();
    }
}

void Display::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (transport_) {
        transport_->close();
    }
}

void Display::set_mode(Mode mode, const Rect& area) {
    if (verbose_) {
        std::cout << "set_mode " << mode_name(mode) << " ("
                  << area.x0 << "," << area.y0 << ")-(" << area.x1 << "," << area.y1 << ")"
                  << std::endl;
    }
    exchange(build_set_mode_frame(mode, area), SET_MODE_RESPONSE_SIZE);
}

void Display::redraw(const Rect& area) {
    if (verbose_) {
        std::cout << "redraw (" << area.x0 << "," << area.y0 << ")-("
                  << area.x1 << "," << area.y1 << ")" << std::endl;
    }
    exchange(build_redraw_frame(area), REDRAW_RESPONSE_SIZE);
}

void Display::exchange(const Frame& frame, size_t response_size) {
    // The controller cannot interleave request/response pairs
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (!transport_->is_open()) {
        throw TransportIoError("Display not connected");
    }

    if (verbose_) {
        std::cout << "  -> " << format_hex(frame.data(), frame.size()) << std::endl;
    }
    transport_->write(std::vector<uint8_t>(frame.begin(), frame.end()));

    std::vector<uint8_t> response(response_size, 0);
    size_t n = transport_->read_timeout(response.data(), response.size(), RESPONSE_TIMEOUT_MS);
    if (n == 0) {
        throw TimeoutError("Empty response from display controller");
    }

    // Short reports are zero-padded to the fixed response size
    Outcome outcome = decode_status(response.data(), response.size());
    if (verbose_) {
        std::cout << "  <- status 0x" << format_hex(response.data() + 1, 1)
                  << format_hex(response.data(), 1) << " (" << outcome_name(outcome) << ")"
                  << std::endl;
    }

    switch (outcome) {
        case Outcome::Success:
            return;
        case Outcome::InvalidCommand:
            throw InvalidCommandError("Display controller rejected command: invalid command");
        case Outcome::ChecksumMismatch:
            // Frame CRC is computed locally, so this means a broken encoder or link
            std::cerr << "Display controller reported a checksum mismatch for frame "
                      << format_hex(frame.data(), frame.size()) << std::endl;
            throw ChecksumMismatchError("Display controller rejected command: checksum incorrect");
    }
}
