#pragma once

#include "hid_transport.hpp"
#include "protocol.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

/// Glider display controller: mode and redraw commands over HID.
///
/// Each command is one blocking write followed by one read with a
/// RESPONSE_TIMEOUT_MS timeout. Calls on one Display are serialised
/// internally, so a handle may be shared between threads.
class Display {
public:
    /// Use the build-time transport backend
    explicit Display(const TransportOptions& options = {});

    /// Use a caller-supplied transport (opened by connect() if needed)
    explicit Display(std::unique_ptr<HidTransport> transport);

    ~Display();

    Display(const Display&) = delete;
    Display& operator=(const Display&) = delete;

    /// Open the transport. Throws TransportUnavailableError.
    void connect();

    /// Close connection
    void close();

    /// Set the mode for a region. The firmware always redraws the region too.
    void set_mode(Mode mode, const Rect& area);

    /// Force a redraw of the region. The controller flashes the area black
    /// to white first to clear ghosting.
    void redraw(const Rect& area);

    /// Print frames and status words to stdout
    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    void exchange(const Frame& frame, size_t response_size);

    std::unique_ptr<HidTransport> transport_;
    std::mutex io_mutex_;
    std::atomic<bool> verbose_{false};
};
