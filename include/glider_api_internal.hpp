#pragma once

#include "glider_api.h"
#include "glider_display.hpp"
#include "hid_transport.hpp"
#include <memory>
#include <utility>

struct GliderDisplay {
    explicit GliderDisplay(const TransportOptions& options) : display(options) {}
    explicit GliderDisplay(std::unique_ptr<HidTransport> transport)
        : display(std::move(transport)) {}

    Display display;
};

/// Connect a C API handle over a given transport.
/// Same result contract as glider_create_display.
GliderResponse glider_create_display_with(std::unique_ptr<HidTransport> transport,
                                          GliderDisplay** out);
